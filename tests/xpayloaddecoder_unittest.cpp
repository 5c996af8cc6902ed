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
#include "xpayloaddecoder.h"

#include "gtest/gtest.h"

TEST(XPayloadDecoderTest, Base64IsTriedFirst)
{
    XPayloadDecoder decoder;
    XPayloadDecoder::RESULT result = decoder.decode("TURNUAEAAAA=", XPayloadDecoder::getDefaultOptions());

    EXPECT_TRUE(result.bIsDecoded);
    EXPECT_EQ(XPayloadDecoder::METHOD_BASE64, result.method);
    EXPECT_EQ(QByteArray("MDMP\x01\x00\x00\x00", 8), result.baData);
    ASSERT_EQ(1, result.listAttempts.size());
    EXPECT_TRUE(result.listAttempts.at(0).bSuccess);
    EXPECT_EQ(8, result.listAttempts.at(0).nDecodedSize);
    EXPECT_FALSE(result.bIsRawAnalysisPresent);
}

TEST(XPayloadDecoderTest, FallsBackToHex)
{
    XPayloadDecoder decoder;
    XPayloadDecoder::RESULT result = decoder.decode("4d:44:4d:50:01:00:00:00:02:00:00:00:10:00:00:00:ff", XPayloadDecoder::getDefaultOptions());

    EXPECT_TRUE(result.bIsDecoded);
    EXPECT_EQ(XPayloadDecoder::METHOD_HEX, result.method);
    ASSERT_EQ(17, result.baData.size());
    EXPECT_EQ(QByteArray("MDMP"), result.baData.left(4));
    EXPECT_EQ('\xFF', result.baData.at(16));

    ASSERT_EQ(2, result.listAttempts.size());
    EXPECT_EQ(XPayloadDecoder::METHOD_BASE64, result.listAttempts.at(0).method);
    EXPECT_FALSE(result.listAttempts.at(0).bSuccess);
    EXPECT_EQ(XPayloadDecoder::DECLINE_REASON_INCORRECTPADDING, result.listAttempts.at(0).declineReason);
    EXPECT_FALSE(result.listAttempts.at(0).sErrorString.isEmpty());
    EXPECT_TRUE(result.listAttempts.at(1).bSuccess);
}

TEST(XPayloadDecoderTest, FallsBackToRawAnalysis)
{
    XPayloadDecoder decoder;
    XPayloadDecoder::RESULT result = decoder.decode("xyz-xyz", XPayloadDecoder::getDefaultOptions());

    EXPECT_FALSE(result.bIsDecoded);
    EXPECT_EQ(XPayloadDecoder::METHOD_RAW, result.method);
    EXPECT_TRUE(result.baData.isEmpty());
    ASSERT_EQ(3, result.listAttempts.size());
    EXPECT_EQ(XPayloadDecoder::DECLINE_REASON_INCORRECTPADDING, result.listAttempts.at(0).declineReason);
    EXPECT_EQ(XPayloadDecoder::DECLINE_REASON_EMPTYINPUT, result.listAttempts.at(1).declineReason);
    EXPECT_EQ(XPayloadDecoder::METHOD_RAW, result.listAttempts.at(2).method);

    ASSERT_TRUE(result.bIsRawAnalysisPresent);
    EXPECT_EQ(7, result.rawAnalysis.nLength);
    ASSERT_EQ(1, result.rawAnalysis.listPatterns.size());
    EXPECT_EQ(QString("xyz"), result.rawAnalysis.listPatterns.at(0).sPattern);
    EXPECT_EQ(2, result.rawAnalysis.listPatterns.at(0).nCount);
}

TEST(XPayloadDecoderTest, EmptyDecodedResultIsDeclined)
{
    XPayloadDecoder decoder;
    XPayloadDecoder::RESULT result = decoder.decode("==", XPayloadDecoder::getDefaultOptions());

    EXPECT_FALSE(result.bIsDecoded);
    ASSERT_GE(result.listAttempts.size(), 1);
    EXPECT_EQ(XPayloadDecoder::DECLINE_REASON_EMPTYRESULT, result.listAttempts.at(0).declineReason);
}

TEST(XPayloadDecoderTest, HexRules)
{
    QByteArray baResult;
    XPayloadDecoder::DECLINE_REASON declineReason = XPayloadDecoder::DECLINE_REASON_NONE;
    QString sErrorString;

    EXPECT_FALSE(XPayloadDecoder::decodeHex("abc", &baResult, &declineReason, &sErrorString));
    EXPECT_EQ(XPayloadDecoder::DECLINE_REASON_ODDLENGTH, declineReason);
    EXPECT_FALSE(sErrorString.isEmpty());

    declineReason = XPayloadDecoder::DECLINE_REASON_NONE;
    sErrorString.clear();

    EXPECT_TRUE(XPayloadDecoder::decodeHex("DE AD be ef", &baResult, &declineReason, &sErrorString));
    EXPECT_EQ(QByteArray("\xDE\xAD\xBE\xEF", 4), baResult);
    EXPECT_EQ(XPayloadDecoder::DECLINE_REASON_NONE, declineReason);
}

TEST(XPayloadDecoderTest, RawCharacterClasses)
{
    XPayloadDecoder::RAW_ANALYSIS analysis = XPayloadDecoder::analyzeRaw("ab 12!", XPayloadDecoder::getDefaultOptions());

    EXPECT_EQ(6, analysis.nLength);
    EXPECT_EQ(6, analysis.nPrintableCount);
    EXPECT_EQ(2, analysis.nDigitCount);
    EXPECT_EQ(2, analysis.nLetterCount);
    EXPECT_EQ(1, analysis.nSpecialCount);
    EXPECT_DOUBLE_EQ(100.0, analysis.dPrintablePercent);
    EXPECT_NEAR(16.67, analysis.dSpecialPercent, 0.01);
}

TEST(XPayloadDecoderTest, RawPreview)
{
    XPayloadDecoder::OPTIONS options = XPayloadDecoder::getDefaultOptions();
    options.nPreviewLength = 3;

    XPayloadDecoder::RAW_ANALYSIS analysis = XPayloadDecoder::analyzeRaw("abcdefgh", options);

    EXPECT_EQ(QString("abc"), analysis.sHead);
    EXPECT_EQ(QString("fgh"), analysis.sTail);

    analysis = XPayloadDecoder::analyzeRaw("", options);

    EXPECT_EQ(0, analysis.nLength);
    EXPECT_DOUBLE_EQ(0.0, analysis.dPrintablePercent);
    EXPECT_TRUE(analysis.listPatterns.isEmpty());
}

TEST(XPayloadDecoderTest, RepeatingSubstringsRanked)
{
    QList<XBinaryForensics::TEXT_PATTERN> listPatterns = XPayloadDecoder::getRepeatingSubstrings("abcabcabc", 3, 10);

    ASSERT_EQ(9, listPatterns.size());
    EXPECT_EQ(QString("abc"), listPatterns.at(0).sPattern);
    EXPECT_EQ(3, listPatterns.at(0).nCount);
    EXPECT_EQ(QString("abcabc"), listPatterns.at(1).sPattern);
    EXPECT_EQ(QString("abcab"), listPatterns.at(2).sPattern);
    EXPECT_EQ(QString("bcabc"), listPatterns.at(3).sPattern);
    EXPECT_EQ(QString("cab"), listPatterns.at(8).sPattern);

    for (qint32 i = 1; i < listPatterns.size(); i++) {
        EXPECT_GE(listPatterns.at(i - 1).nCount, listPatterns.at(i).nCount);
    }
}

TEST(XPayloadDecoderTest, RepeatingSubstringsSkipNonAlphanumeric)
{
    EXPECT_TRUE(XPayloadDecoder::getRepeatingSubstrings("a-ba-ba-b", 3, 10).isEmpty());
    EXPECT_EQ(1, XPayloadDecoder::getRepeatingSubstrings("abcabcabc", 3, 10, 1).size());
}

TEST(XPayloadDecoderTest, MethodNames)
{
    EXPECT_EQ(QString("Base64"), XPayloadDecoder::methodToString(XPayloadDecoder::METHOD_BASE64));
    EXPECT_EQ(QString("Hex"), XPayloadDecoder::methodToString(XPayloadDecoder::METHOD_HEX));
    EXPECT_EQ(QString("Raw analysis"), XPayloadDecoder::methodToString(XPayloadDecoder::METHOD_RAW));
}

TEST(XPayloadDecoderTest, RawAnalysisCountsCodePoints)
{
    // U+1D400 MATHEMATICAL BOLD CAPITAL A, one code point, two UTF-16 units
    QString sText = QString::fromUtf8("a\xF0\x9D\x90\x80" "1 ");

    XPayloadDecoder::RAW_ANALYSIS analysis = XPayloadDecoder::analyzeRaw(sText, XPayloadDecoder::getDefaultOptions());

    EXPECT_EQ(4, analysis.nLength);
    EXPECT_EQ(3, analysis.nPrintableCount);
    EXPECT_EQ(1, analysis.nDigitCount);
    EXPECT_EQ(1, analysis.nLetterCount);
    EXPECT_EQ(1, analysis.nSpecialCount);
    EXPECT_DOUBLE_EQ(25.0, analysis.dSpecialPercent);
}

TEST(XPayloadDecoderTest, RawPreviewKeepsSurrogatePairs)
{
    QString sPair = QString::fromUtf8("\xF0\x9F\x98\x80");
    QString sText = sPair + QString("abc") + sPair;

    XPayloadDecoder::OPTIONS options = XPayloadDecoder::getDefaultOptions();
    options.nPreviewLength = 2;

    XPayloadDecoder::RAW_ANALYSIS analysis = XPayloadDecoder::analyzeRaw(sText, options);

    EXPECT_EQ(5, analysis.nLength);
    EXPECT_EQ(sPair + QString("a"), analysis.sHead);
    EXPECT_EQ(QString("c") + sPair, analysis.sTail);

    options.nPreviewLength = 100;
    analysis = XPayloadDecoder::analyzeRaw(sText, options);

    EXPECT_EQ(sText, analysis.sHead);
    EXPECT_EQ(sText, analysis.sTail);
}

TEST(XPayloadDecoderTest, RepeatingSubstringsAcceptNonBmpLetters)
{
    QString sText = QString::fromUtf8("x\xF0\x9D\x90\x80y-x\xF0\x9D\x90\x80y");

    QList<XBinaryForensics::TEXT_PATTERN> listPatterns = XPayloadDecoder::getRepeatingSubstrings(sText, 3, 10);

    ASSERT_EQ(1, listPatterns.size());
    EXPECT_EQ(QString::fromUtf8("x\xF0\x9D\x90\x80y"), listPatterns.at(0).sPattern);
    EXPECT_EQ(2, listPatterns.at(0).nCount);
    EXPECT_EQ(3, XBinaryForensics::getPatternLength(listPatterns.at(0)));
}
