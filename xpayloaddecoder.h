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
#ifndef XPAYLOADDECODER_H
#define XPAYLOADDECODER_H

#include "xbase64decoder.h"
#include "xbinaryforensics.h"

#include <QVector>

class XPayloadDecoder : public QObject {
    Q_OBJECT

public:
    enum METHOD {
        METHOD_UNKNOWN = 0,
        METHOD_BASE64,
        METHOD_HEX,
        METHOD_RAW
    };

    enum DECLINE_REASON {
        DECLINE_REASON_NONE = 0,
        DECLINE_REASON_EMPTYINPUT,
        DECLINE_REASON_EMPTYRESULT,
        DECLINE_REASON_EXCESSDATA,
        DECLINE_REASON_INCORRECTPADDING,
        DECLINE_REASON_ODDLENGTH
    };

    struct OPTIONS {
        qint32 nMinTextPatternLength;
        qint32 nMaxTextPatternLength;
        qint32 nTextPatternLimit;  // -1 no limit
        qint32 nPreviewLength;
    };

    struct ATTEMPT {
        METHOD method;
        bool bSuccess;
        DECLINE_REASON declineReason;
        QString sErrorString;
        qint64 nDecodedSize;
    };

    struct RAW_ANALYSIS {
        qint32 nLength;
        QString sHead;
        QString sTail;
        qint32 nPrintableCount;
        qint32 nDigitCount;
        qint32 nLetterCount;
        qint32 nSpecialCount;
        double dPrintablePercent;
        double dDigitPercent;
        double dLetterPercent;
        double dSpecialPercent;
        QList<XBinaryForensics::TEXT_PATTERN> listPatterns;
    };

    struct RESULT {
        bool bIsDecoded;
        METHOD method;
        QByteArray baData;
        QList<ATTEMPT> listAttempts;
        bool bIsRawAnalysisPresent;
        RAW_ANALYSIS rawAnalysis;
    };

    // Byte strategy: returns false and sets the reason when it declines
    typedef bool (*DECODE_FUNCTION)(const QString &sEncoded, QByteArray *pbaResult, DECLINE_REASON *pDeclineReason, QString *psErrorString);

    struct STRATEGY {
        METHOD method;
        DECODE_FUNCTION pFunction;
    };

    explicit XPayloadDecoder(QObject *pParent = nullptr);

    static OPTIONS getDefaultOptions();
    static QList<STRATEGY> getStrategies();
    RESULT decode(const QString &sEncoded, const OPTIONS &options);

    static bool decodeBase64(const QString &sEncoded, QByteArray *pbaResult, DECLINE_REASON *pDeclineReason, QString *psErrorString);
    static bool decodeHex(const QString &sEncoded, QByteArray *pbaResult, DECLINE_REASON *pDeclineReason, QString *psErrorString);
    static RAW_ANALYSIS analyzeRaw(const QString &sEncoded, const OPTIONS &options);
    static QList<XBinaryForensics::TEXT_PATTERN> getRepeatingSubstrings(const QString &sText, qint32 nMinLength, qint32 nMaxLength, qint32 nLimit = -1);
    static bool isAlphanumeric(const QVector<uint> &listCodePoints, qint32 nStart, qint32 nSize);

    static QString methodToString(METHOD method);
    static QString declineReasonToString(DECLINE_REASON declineReason);

signals:
    void infoMessage(const QString &sText);
    void errorMessage(const QString &sText);

private:
    static QString _codePointsToString(const QVector<uint> &listCodePoints, qint32 nStart, qint32 nSize);
};

#endif  // XPAYLOADDECODER_H
