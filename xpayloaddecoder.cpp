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

#include <QHash>

XPayloadDecoder::XPayloadDecoder(QObject *pParent) : QObject(pParent)
{
}

XPayloadDecoder::OPTIONS XPayloadDecoder::getDefaultOptions()
{
    OPTIONS result = {};

    result.nMinTextPatternLength = 3;
    result.nMaxTextPatternLength = 10;
    result.nTextPatternLimit = -1;
    result.nPreviewLength = 100;

    return result;
}

QList<XPayloadDecoder::STRATEGY> XPayloadDecoder::getStrategies()
{
    QList<STRATEGY> listResult;

    STRATEGY strategyBase64 = {METHOD_BASE64, &XPayloadDecoder::decodeBase64};
    STRATEGY strategyHex = {METHOD_HEX, &XPayloadDecoder::decodeHex};

    listResult.append(strategyBase64);
    listResult.append(strategyHex);

    return listResult;
}

XPayloadDecoder::RESULT XPayloadDecoder::decode(const QString &sEncoded, const OPTIONS &options)
{
    RESULT result = {};

    QList<STRATEGY> listStrategies = getStrategies();

    qint32 nNumberOfStrategies = listStrategies.size();

    for (qint32 i = 0; i < nNumberOfStrategies; i++) {
        const STRATEGY &strategy = listStrategies.at(i);

        emit infoMessage(tr("Trying %1 decoding...").arg(methodToString(strategy.method)));

        ATTEMPT attempt = {};
        attempt.method = strategy.method;

        QByteArray baDecoded;

        attempt.bSuccess = strategy.pFunction(sEncoded, &baDecoded, &attempt.declineReason, &attempt.sErrorString);

        if (attempt.bSuccess) {
            attempt.nDecodedSize = baDecoded.size();
            result.listAttempts.append(attempt);

            result.bIsDecoded = true;
            result.method = strategy.method;
            result.baData = baDecoded;

            emit infoMessage(tr("%1 decoded %2 bytes").arg(methodToString(strategy.method), QString::number(baDecoded.size())));

            break;
        }

        result.listAttempts.append(attempt);

        emit errorMessage(QString("%1 %2: %3").arg(methodToString(strategy.method), tr("decoding failed"), attempt.sErrorString));
    }

    if (!result.bIsDecoded) {
        emit infoMessage(tr("Trying %1...").arg(methodToString(METHOD_RAW)));

        ATTEMPT attempt = {};
        attempt.method = METHOD_RAW;
        attempt.bSuccess = true;

        result.listAttempts.append(attempt);

        result.method = METHOD_RAW;
        result.bIsRawAnalysisPresent = true;
        result.rawAnalysis = analyzeRaw(sEncoded, options);
    }

    return result;
}

bool XPayloadDecoder::decodeBase64(const QString &sEncoded, QByteArray *pbaResult, DECLINE_REASON *pDeclineReason, QString *psErrorString)
{
    bool bResult = false;

    QByteArray baClean = XBase64Decoder::clean(sEncoded);

    if (!baClean.isEmpty()) {
        qint32 nDataChars = 0;
        XBase64Decoder::STATUS status = XBase64Decoder::decode(baClean, pbaResult, &nDataChars);

        if (status == XBase64Decoder::STATUS_OK) {
            if (!pbaResult->isEmpty()) {
                bResult = true;
            } else {
                *pDeclineReason = DECLINE_REASON_EMPTYRESULT;
            }
        } else {
            if (status == XBase64Decoder::STATUS_EXCESSDATA) {
                *pDeclineReason = DECLINE_REASON_EXCESSDATA;
            } else {
                *pDeclineReason = DECLINE_REASON_INCORRECTPADDING;
            }

            *psErrorString = XBase64Decoder::statusToString(status, nDataChars);
        }
    } else {
        *pDeclineReason = DECLINE_REASON_EMPTYINPUT;
    }

    if (!bResult) {
        pbaResult->clear();

        if (psErrorString->isEmpty()) {
            *psErrorString = declineReasonToString(*pDeclineReason);
        }
    }

    return bResult;
}

bool XPayloadDecoder::decodeHex(const QString &sEncoded, QByteArray *pbaResult, DECLINE_REASON *pDeclineReason, QString *psErrorString)
{
    bool bResult = false;

    QByteArray baClean;

    qint32 nSize = sEncoded.size();

    baClean.reserve(nSize);

    for (qint32 i = 0; i < nSize; i++) {
        ushort nUnicode = sEncoded.at(i).unicode();

        if (((nUnicode >= '0') && (nUnicode <= '9')) || ((nUnicode >= 'a') && (nUnicode <= 'f')) || ((nUnicode >= 'A') && (nUnicode <= 'F'))) {
            baClean.append((char)nUnicode);
        }
    }

    if (baClean.isEmpty()) {
        *pDeclineReason = DECLINE_REASON_EMPTYINPUT;
    } else if (baClean.size() % 2) {
        *pDeclineReason = DECLINE_REASON_ODDLENGTH;
    } else {
        // Only hex digits are left, so every pair is a byte
        *pbaResult = QByteArray::fromHex(baClean);

        if (!pbaResult->isEmpty()) {
            bResult = true;
        } else {
            *pDeclineReason = DECLINE_REASON_EMPTYRESULT;
        }
    }

    if (!bResult) {
        pbaResult->clear();
        *psErrorString = declineReasonToString(*pDeclineReason);
    }

    return bResult;
}

XPayloadDecoder::RAW_ANALYSIS XPayloadDecoder::analyzeRaw(const QString &sEncoded, const OPTIONS &options)
{
    RAW_ANALYSIS result = {};

    // Lengths, previews and counts are in code points, a surrogate pair is one character
    QVector<uint> listCodePoints = sEncoded.toUcs4();

    qint32 nLength = listCodePoints.size();
    qint32 nPreviewLength = qMin(qMax(options.nPreviewLength, 0), nLength);

    result.nLength = nLength;
    result.sHead = _codePointsToString(listCodePoints, 0, nPreviewLength);
    result.sTail = _codePointsToString(listCodePoints, nLength - nPreviewLength, nPreviewLength);

    for (qint32 i = 0; i < nLength; i++) {
        uint nCodePoint = listCodePoints.at(i);

        bool bIsAsciiLetter = ((nCodePoint >= 'A') && (nCodePoint <= 'Z')) || ((nCodePoint >= 'a') && (nCodePoint <= 'z'));
        bool bIsAsciiDigit = (nCodePoint >= '0') && (nCodePoint <= '9');

        if ((nCodePoint < 0x100) && XBinaryForensics::isPrintable((quint8)nCodePoint)) {
            result.nPrintableCount++;
        }

        if (QChar::isDigit(nCodePoint)) {
            result.nDigitCount++;
        }

        if (bIsAsciiLetter) {
            result.nLetterCount++;
        }

        if ((!bIsAsciiLetter) && (!bIsAsciiDigit) && (!QChar::isSpace(nCodePoint))) {
            result.nSpecialCount++;
        }
    }

    if (nLength > 0) {
        result.dPrintablePercent = (result.nPrintableCount * 100.0) / nLength;
        result.dDigitPercent = (result.nDigitCount * 100.0) / nLength;
        result.dLetterPercent = (result.nLetterCount * 100.0) / nLength;
        result.dSpecialPercent = (result.nSpecialCount * 100.0) / nLength;
    }

    result.listPatterns = getRepeatingSubstrings(sEncoded, options.nMinTextPatternLength, options.nMaxTextPatternLength, options.nTextPatternLimit);

    return result;
}

QList<XBinaryForensics::TEXT_PATTERN> XPayloadDecoder::getRepeatingSubstrings(const QString &sText, qint32 nMinLength, qint32 nMaxLength, qint32 nLimit)
{
    QList<XBinaryForensics::TEXT_PATTERN> listAll;
    QHash<QString, qint32> mapIndexes;

    QVector<uint> listCodePoints = sText.toUcs4();

    qint32 nSize = listCodePoints.size();
    // A substring as long as the whole text cannot repeat
    qint32 nUpperLength = qMin(nMaxLength, nSize - 1);

    for (qint32 nLength = qMax(nMinLength, 1); nLength <= nUpperLength; nLength++) {
        for (qint32 i = 0; i + nLength <= nSize; i++) {
            if (!isAlphanumeric(listCodePoints, i, nLength)) {
                continue;
            }

            QString sPattern = _codePointsToString(listCodePoints, i, nLength);

            QHash<QString, qint32>::const_iterator iter = mapIndexes.constFind(sPattern);

            if (iter != mapIndexes.constEnd()) {
                listAll[iter.value()].nCount++;
            } else {
                XBinaryForensics::TEXT_PATTERN pattern = {};
                pattern.sPattern = sPattern;
                pattern.nCount = 1;

                mapIndexes.insert(sPattern, (qint32)listAll.size());
                listAll.append(pattern);
            }
        }
    }

    QList<XBinaryForensics::TEXT_PATTERN> listResult;

    qint32 nNumberOfPatterns = listAll.size();

    for (qint32 i = 0; i < nNumberOfPatterns; i++) {
        if (listAll.at(i).nCount > 1) {
            listResult.append(listAll.at(i));
        }
    }

    XBinaryForensics::sortPatterns(&listResult);

    if ((nLimit >= 0) && (listResult.size() > nLimit)) {
        listResult = listResult.mid(0, nLimit);
    }

    return listResult;
}

bool XPayloadDecoder::isAlphanumeric(const QVector<uint> &listCodePoints, qint32 nStart, qint32 nSize)
{
    bool bResult = (nSize > 0);

    for (qint32 i = nStart; i < nStart + nSize; i++) {
        if (!QChar::isLetterOrNumber(listCodePoints.at(i))) {
            bResult = false;
            break;
        }
    }

    return bResult;
}

QString XPayloadDecoder::methodToString(METHOD method)
{
    QString sResult = tr("Unknown");

    if (method == METHOD_BASE64) {
        sResult = QString("Base64");
    } else if (method == METHOD_HEX) {
        sResult = QString("Hex");
    } else if (method == METHOD_RAW) {
        sResult = tr("Raw analysis");
    }

    return sResult;
}

QString XPayloadDecoder::declineReasonToString(DECLINE_REASON declineReason)
{
    QString sResult;

    switch (declineReason) {
        case DECLINE_REASON_NONE: break;
        case DECLINE_REASON_EMPTYINPUT: sResult = tr("No characters of the alphabet"); break;
        case DECLINE_REASON_EMPTYRESULT: sResult = tr("Decoded to zero bytes"); break;
        case DECLINE_REASON_EXCESSDATA: sResult = tr("Excess data characters"); break;
        case DECLINE_REASON_INCORRECTPADDING: sResult = tr("Incorrect padding"); break;
        case DECLINE_REASON_ODDLENGTH: sResult = tr("Odd number of hex digits"); break;
    }

    return sResult;
}

QString XPayloadDecoder::_codePointsToString(const QVector<uint> &listCodePoints, qint32 nStart, qint32 nSize)
{
    QString sResult;

    sResult.reserve(nSize * 2);

    for (qint32 i = nStart; i < nStart + nSize; i++) {
        uint nCodePoint = listCodePoints.at(i);

        if (QChar::requiresSurrogates(nCodePoint)) {
            sResult.append(QChar(QChar::highSurrogate(nCodePoint)));
            sResult.append(QChar(QChar::lowSurrogate(nCodePoint)));
        } else {
            sResult.append(QChar((ushort)nCodePoint));
        }
    }

    return sResult;
}
