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
#include "xminidumpheader.h"

#include "gtest/gtest.h"

namespace {

const char kHeader[] = "\x4D\x44\x4D\x50\x01\x00\x00\x00\x02\x00\x00\x00\x10\x00\x00\x00";

}  // namespace

TEST(XMiniDumpHeaderTest, ReadsAllFields)
{
    QByteArray baData(kHeader, 16);

    EXPECT_TRUE(XMiniDumpHeader::isSignaturePresent(baData));

    XMiniDumpHeader::HEADER header = XMiniDumpHeader::read_HEADER(baData);

    EXPECT_TRUE(header.bIsVersionPresent);
    EXPECT_EQ(1u, header.nVersion);
    EXPECT_TRUE(header.bIsNumberOfStreamsPresent);
    EXPECT_EQ(2u, header.nNumberOfStreams);
    EXPECT_TRUE(header.bIsStreamDirectoryRvaPresent);
    EXPECT_EQ(16u, header.nStreamDirectoryRva);
}

TEST(XMiniDumpHeaderTest, TruncatedBufferDropsOnlyMissingFields)
{
    // Version complete, stream count cut after two bytes
    QByteArray baData(kHeader, 10);

    XMiniDumpHeader::HEADER header = XMiniDumpHeader::read_HEADER(baData);

    EXPECT_TRUE(header.bIsVersionPresent);
    EXPECT_EQ(1u, header.nVersion);
    EXPECT_FALSE(header.bIsNumberOfStreamsPresent);
    EXPECT_FALSE(header.bIsStreamDirectoryRvaPresent);
    EXPECT_FALSE(XMiniDumpHeader::isEmpty(header));
}

TEST(XMiniDumpHeaderTest, SignatureOnlyGivesEmptyHeader)
{
    QByteArray baData("MDMP");

    XMiniDumpHeader::HEADER header = XMiniDumpHeader::read_HEADER(baData);

    EXPECT_TRUE(XMiniDumpHeader::isEmpty(header));
}

TEST(XMiniDumpHeaderTest, ZeroFieldsArePresent)
{
    QByteArray baData("MDMP", 4);
    baData.append(QByteArray(12, '\0'));

    XMiniDumpHeader::HEADER header = XMiniDumpHeader::read_HEADER(baData);

    EXPECT_TRUE(header.bIsVersionPresent);
    EXPECT_EQ(0u, header.nVersion);
    EXPECT_TRUE(header.bIsStreamDirectoryRvaPresent);
    EXPECT_EQ(0u, header.nStreamDirectoryRva);
}

TEST(XMiniDumpHeaderTest, DirectoryOffsetIsNotValidated)
{
    QByteArray baData(kHeader, 16);
    baData[12] = '\xFF';
    baData[13] = '\xFF';

    XMiniDumpHeader::HEADER header = XMiniDumpHeader::read_HEADER(baData);

    EXPECT_TRUE(header.bIsStreamDirectoryRvaPresent);
    EXPECT_EQ(0xFFFFu, header.nStreamDirectoryRva);
}

TEST(XMiniDumpHeaderTest, SignatureCheck)
{
    EXPECT_FALSE(XMiniDumpHeader::isSignaturePresent(QByteArray("MDM")));
    EXPECT_FALSE(XMiniDumpHeader::isSignaturePresent(QByteArray("PMDM")));
    EXPECT_FALSE(XMiniDumpHeader::isSignaturePresent(QByteArray()));
}
