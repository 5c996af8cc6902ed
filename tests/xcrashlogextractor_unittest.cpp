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
#include "xcrashlogextractor.h"

#include "gtest/gtest.h"

namespace {

const char kCrashLog[] =
    "10-19 12:34:56.700  1234  1250 I chromium: starting renderer\n"
    "\n"
    "10-19 12:34:56.789  1234  1250 W chromium: low memory\n"
    "10-19 12:34:56.790  1234  1250 F crashpad: -----BEGIN CRASHPAD MINIDUMP-----\n"
    "10-19 12:34:56.790  1234  1250 F crashpad: TURNUAEA\n"
    "10-19 12:34:56.790  1234  1250 F crashpad: AAA=\n"
    "10-19 12:34:56.791  1234  1250 F crashpad: -----END CRASHPAD MINIDUMP-----\n";

}  // namespace

TEST(XCrashLogExtractorTest, JoinsPayloadLines)
{
    XCrashLogExtractor::PAYLOAD payload = XCrashLogExtractor::extractPayload(QString::fromLatin1(kCrashLog));

    EXPECT_TRUE(payload.bIsFound);
    EXPECT_EQ(4, payload.nNumberOfLines);
    EXPECT_EQ(QString("TURNUAEAAAA="), payload.sEncoded);
}

TEST(XCrashLogExtractorTest, NoMarkerMeansNoPayload)
{
    XCrashLogExtractor::PAYLOAD payload = XCrashLogExtractor::extractPayload("10-19 12:34:56.700  1234  1250 I chromium: nothing here\n");

    EXPECT_FALSE(payload.bIsFound);
    EXPECT_EQ(0, payload.nNumberOfLines);
    EXPECT_TRUE(payload.sEncoded.isEmpty());
}

TEST(XCrashLogExtractorTest, MarkerNeedsContent)
{
    XCrashLogExtractor::PAYLOAD payload = XCrashLogExtractor::extractPayload("F crashpad: \nF crashpad:\n");

    EXPECT_TRUE(payload.bIsFound);
    EXPECT_EQ(1, payload.nNumberOfLines);
    EXPECT_TRUE(payload.sEncoded.isEmpty());
}

TEST(XCrashLogExtractorTest, CaptureStopsAtDollar)
{
    XCrashLogExtractor::PAYLOAD payload = XCrashLogExtractor::extractPayload("F crashpad: AAAA$junk\nF crashpad: BBBB\n");

    EXPECT_EQ(2, payload.nNumberOfLines);
    EXPECT_EQ(QString("AAAABBBB"), payload.sEncoded);
}

TEST(XCrashLogExtractorTest, SentinelsOnlyGiveEmptyPayload)
{
    XCrashLogExtractor::PAYLOAD payload =
        XCrashLogExtractor::extractPayload("F crashpad: -----BEGIN CRASHPAD MINIDUMP-----\nF crashpad: -----END CRASHPAD MINIDUMP-----\n");

    EXPECT_TRUE(payload.bIsFound);
    EXPECT_EQ(2, payload.nNumberOfLines);
    EXPECT_TRUE(payload.sEncoded.isEmpty());
}

TEST(XCrashLogExtractorTest, LogContext)
{
    XCrashLogExtractor::LOG_CONTEXT context = XCrashLogExtractor::getLogContext(QString::fromLatin1(kCrashLog));

    EXPECT_TRUE(context.bIsTimestampPresent);
    EXPECT_EQ(QString("10-19 12:34:56.700"), context.sTimestamp);
    EXPECT_TRUE(context.bIsProcessIdPresent);
    EXPECT_EQ(1234, context.nProcessId);
    EXPECT_EQ(3, context.nMarkerLineIndex);

    ASSERT_EQ(2, context.listContextLines.size());
    EXPECT_EQ(QString("10-19 12:34:56.700  1234  1250 I chromium: starting renderer"), context.listContextLines.at(0));
    EXPECT_EQ(QString("10-19 12:34:56.789  1234  1250 W chromium: low memory"), context.listContextLines.at(1));
}

TEST(XCrashLogExtractorTest, ContextWindowIsBounded)
{
    QString sLog;

    for (qint32 i = 0; i < 8; i++) {
        sLog.append(QString("line %1\r\n").arg(i));
    }

    sLog.append("F crashpad: AAAA\r\n");

    XCrashLogExtractor::LOG_CONTEXT context = XCrashLogExtractor::getLogContext(sLog, 5);

    EXPECT_EQ(8, context.nMarkerLineIndex);
    ASSERT_EQ(5, context.listContextLines.size());
    EXPECT_EQ(QString("line 3"), context.listContextLines.at(0));
    EXPECT_EQ(QString("line 7"), context.listContextLines.at(4));
    EXPECT_FALSE(context.bIsTimestampPresent);
    EXPECT_FALSE(context.bIsProcessIdPresent);
}

TEST(XCrashLogExtractorTest, MarkerOnFirstLineHasNoContext)
{
    XCrashLogExtractor::LOG_CONTEXT context = XCrashLogExtractor::getLogContext("F crashpad: AAAA\nafter\n");

    EXPECT_EQ(0, context.nMarkerLineIndex);
    EXPECT_TRUE(context.listContextLines.isEmpty());

    context = XCrashLogExtractor::getLogContext("no marker\n");

    EXPECT_EQ(-1, context.nMarkerLineIndex);
    EXPECT_TRUE(context.listContextLines.isEmpty());
}
