/* Copyright (c) 2025 hors<horsicq@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include "xsignaturesniffer.h"

#include "gtest/gtest.h"

namespace {

XSignatureSniffer::SIGNATURE sniff(const char *pszData, qint32 nSize)
{
    return XSignatureSniffer::getSignature(QByteArray(pszData, nSize));
}

}  // namespace

TEST(XSignatureSnifferTest, DetectsKnownContainers)
{
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_MINIDUMP, sniff("MDMP\x01\x00\x00\x00", 8));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_ELF, sniff("\x7f" "ELF\x02\x01\x01", 7));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_ELF, sniff("ELF", 3));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_ZIP, sniff("PK\x03\x04", 4));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_PNG, sniff("\x89" "PNG\r\n\x1a\n", 8));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_GIF, sniff("GIF89a", 6));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_JPEG, sniff("\xFF\xD8\xFF\xE0", 4));
}

TEST(XSignatureSnifferTest, ShortBufferMatchesShortSignature)
{
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_ZIP, sniff("PK", 2));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_JPEG, sniff("\xFF\xD8\xFF", 3));
}

TEST(XSignatureSnifferTest, PartialSignatureIsUnknown)
{
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_UNKNOWN, sniff("MDM", 3));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_UNKNOWN, sniff("P", 1));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_UNKNOWN, sniff("\xFF\xD8", 2));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_UNKNOWN, sniff("", 0));
}

TEST(XSignatureSnifferTest, SignatureMustBeAtStart)
{
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_UNKNOWN, sniff("xxMDMP", 6));
    EXPECT_EQ(XSignatureSniffer::SIGNATURE_UNKNOWN, sniff("\x00PK", 3));
}

TEST(XSignatureSnifferTest, NamesAndDescriptions)
{
    EXPECT_EQ(QString("Minidump"), XSignatureSniffer::signatureToString(XSignatureSniffer::SIGNATURE_MINIDUMP));
    EXPECT_EQ(QString("ZipArchive"), XSignatureSniffer::signatureToString(XSignatureSniffer::SIGNATURE_ZIP));
    EXPECT_EQ(QString("Unknown"), XSignatureSniffer::signatureToString(XSignatureSniffer::SIGNATURE_UNKNOWN));
    EXPECT_EQ(QString("ELF executable"), XSignatureSniffer::signatureToDescription(XSignatureSniffer::SIGNATURE_ELF));
}

TEST(XSignatureSnifferTest, CompressedStreams)
{
    EXPECT_TRUE(XSignatureSniffer::isZlibStream(QByteArray("\x78\x9C\x00\x00\x00\x00", 6)));
    EXPECT_TRUE(XSignatureSniffer::isZlibStream(QByteArray("\x78\xDA\x00\x00\x00\x00", 6)));
    EXPECT_FALSE(XSignatureSniffer::isZlibStream(QByteArray("\x78\x9C", 2)));
    EXPECT_FALSE(XSignatureSniffer::isZlibStream(QByteArray("\x78\x00\x00\x00\x00\x00", 6)));
    EXPECT_TRUE(XSignatureSniffer::isGzipStream(QByteArray("\x1F\x8B\x08", 3)));
    EXPECT_FALSE(XSignatureSniffer::isGzipStream(QByteArray("\x1F", 1)));
}
