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
#include "xbinaryforensics.h"
#include "xbytereader.h"

#include <QHash>
#include <QSet>

#include <cmath>

XBinaryForensics::XBinaryForensics(QObject *pParent) : QObject(pParent)
{
}

XBinaryForensics::OPTIONS XBinaryForensics::getDefaultOptions()
{
    OPTIONS result = {};

    result.nMinStringLength = 4;
    result.nMinPatternLength = 2;
    result.nMaxPatternLength = 4;
    result.nPatternLimit = -1;
    result.nKeywordContextSize = 10;

    return result;
}

XBinaryForensics::FINDINGS XBinaryForensics::analyze(const QByteArray &baData, const OPTIONS &options)
{
    FINDINGS result = {};

    result.nSize = baData.size();
    result.dEntropy = getEntropy(baData);
    result.listPatterns = getRepeatingPatterns(baData, options.nMinPatternLength, options.nMaxPatternLength, options.nPatternLimit);
    result.listStrings = getPrintableStrings(baData, options.nMinStringLength);
    result.listAddresses = getCandidateAddresses(baData);
    result.listKeywordHits = getKeywordHits(baData, options.nKeywordContextSize);

#ifdef QT_DEBUG
    qDebug("XBinaryForensics::analyze: size=%lld entropy=%f patterns=%d strings=%d addresses=%d keywords=%d", result.nSize, result.dEntropy,
           (qint32)result.listPatterns.size(), (qint32)result.listStrings.size(), (qint32)result.listAddresses.size(), (qint32)result.listKeywordHits.size());
#endif

    return result;
}

bool XBinaryForensics::isPrintable(quint8 nByte)
{
    return (nByte >= 32) && (nByte <= 126);
}

double XBinaryForensics::getEntropy(const QByteArray &baData)
{
    double dResult = 0.0;

    qint64 nSize = baData.size();

    if (nSize > 0) {
        qint64 nFrequency[256] = {};
        const quint8 *pData = (const quint8 *)baData.constData();

        for (qint64 i = 0; i < nSize; i++) {
            nFrequency[pData[i]]++;
        }

        for (qint32 i = 0; i < 256; i++) {
            if (nFrequency[i] > 0) {
                double dProbability = (double)nFrequency[i] / (double)nSize;
                dResult -= dProbability * std::log2(dProbability);
            }
        }

        // Rounding noise must not leave [0, 8]
        if (dResult < 0.0) {
            dResult = 0.0;
        } else if (dResult > 8.0) {
            dResult = 8.0;
        }
    }

    return dResult;
}

bool XBinaryForensics::isHighEntropy(double dEntropy)
{
    return dEntropy >= 7.0;
}

QList<XBinaryForensics::PATTERN> XBinaryForensics::getRepeatingPatterns(const QByteArray &baData, qint32 nMinLength, qint32 nMaxLength, qint32 nLimit)
{
    QList<PATTERN> listAll;
    QHash<QByteArray, qint32> mapIndexes;

    qint32 nSize = baData.size();

    for (qint32 nLength = qMax(nMinLength, 1); nLength <= nMaxLength; nLength++) {
        for (qint32 i = 0; i + nLength <= nSize; i++) {
            QByteArray baPattern = baData.mid(i, nLength);

            QHash<QByteArray, qint32>::const_iterator iter = mapIndexes.constFind(baPattern);

            if (iter != mapIndexes.constEnd()) {
                listAll[iter.value()].nCount++;
            } else {
                PATTERN pattern = {};
                pattern.baPattern = baPattern;
                pattern.nCount = 1;

                mapIndexes.insert(baPattern, (qint32)listAll.size());
                listAll.append(pattern);
            }
        }
    }

    QList<PATTERN> listResult;

    qint32 nNumberOfPatterns = listAll.size();

    for (qint32 i = 0; i < nNumberOfPatterns; i++) {
        if (listAll.at(i).nCount > 1) {
            listResult.append(listAll.at(i));
        }
    }

    sortPatterns(&listResult);

    if ((nLimit >= 0) && (listResult.size() > nLimit)) {
        listResult = listResult.mid(0, nLimit);
    }

    return listResult;
}

QList<QString> XBinaryForensics::getPrintableStrings(const QByteArray &baData, qint32 nMinLength)
{
    QList<QString> listResult;

    QByteArray baCurrent;

    qint32 nSize = baData.size();

    for (qint32 i = 0; i < nSize; i++) {
        quint8 nByte = (quint8)baData.at(i);

        if (isPrintable(nByte)) {
            baCurrent.append((char)nByte);
        } else {
            if (baCurrent.size() >= nMinLength) {
                listResult.append(QString::fromLatin1(baCurrent));
            }

            baCurrent.clear();
        }
    }

    if (baCurrent.size() >= nMinLength) {
        listResult.append(QString::fromLatin1(baCurrent));
    }

    return listResult;
}

QList<quint64> XBinaryForensics::getCandidateAddresses(const QByteArray &baData)
{
    QSet<quint64> stAddresses;

    qint64 nSize = baData.size();

    for (qint64 nOffset = 0; nOffset + 4 <= nSize; nOffset += 4) {
        quint32 nValue32 = 0;

        if (XByteReader::_read_uint32(baData, nOffset, &nValue32)) {
            if ((nValue32 >= ADDRESS32_MIN) && (nValue32 <= ADDRESS32_MAX)) {
                stAddresses.insert(nValue32);
            }
        }

        // Not gated on the 32-bit check, the two scans overlap
        quint64 nValue64 = 0;

        if (XByteReader::_read_uint64(baData, nOffset, &nValue64)) {
            if ((nValue64 >= ADDRESS64_MIN) && (nValue64 <= ADDRESS64_MAX)) {
                stAddresses.insert(nValue64);
            }
        }
    }

    QList<quint64> listResult = stAddresses.values();

    std::sort(listResult.begin(), listResult.end());

    return listResult;
}

QList<QByteArray> XBinaryForensics::getCrashKeywords()
{
    QList<QByteArray> listResult;

    listResult.append("SIGSEGV");
    listResult.append("SIGABRT");
    listResult.append("SIGBUS");
    listResult.append("SIGFPE");
    listResult.append("SIGILL");
    listResult.append("segfault");
    listResult.append("abort");
    listResult.append("crash");
    listResult.append("exception");
    listResult.append("fault");
    listResult.append("stack");
    listResult.append("heap");
    listResult.append("memory");
    listResult.append("null");
    listResult.append("access");
    listResult.append("libandroid");
    listResult.append("libc.so");
    listResult.append("libm.so");
    listResult.append("liblog.so");

    return listResult;
}

QList<XBinaryForensics::KEYWORD_HIT> XBinaryForensics::getKeywordHits(const QByteArray &baData, qint32 nContextSize)
{
    QList<KEYWORD_HIT> listResult;

    QList<QByteArray> listKeywords = getCrashKeywords();

    qint32 nNumberOfKeywords = listKeywords.size();
    qint64 nSize = baData.size();

    for (qint32 i = 0; i < nNumberOfKeywords; i++) {
        const QByteArray &baKeyword = listKeywords.at(i);

        qint64 nOffset = baData.indexOf(baKeyword);

        if (nOffset != -1) {
            qint64 nStart = qMax((qint64)0, nOffset - nContextSize);
            qint64 nEnd = qMin(nSize, nOffset + baKeyword.size() + nContextSize);

            KEYWORD_HIT hit = {};
            hit.sKeyword = QString::fromLatin1(baKeyword);
            hit.nOffset = nOffset;
            hit.nContextOffset = nStart;
            hit.baContext = baData.mid((int)nStart, (int)(nEnd - nStart));

            listResult.append(hit);
        }
    }

    return listResult;
}

QString XBinaryForensics::getPrintableText(const QByteArray &baData, char cReplace)
{
    QByteArray baResult = baData;

    qint32 nSize = baResult.size();

    for (qint32 i = 0; i < nSize; i++) {
        if (!isPrintable((quint8)baResult.at(i))) {
            baResult[i] = cReplace;
        }
    }

    return QString::fromLatin1(baResult);
}

qint32 XBinaryForensics::getPatternLength(const PATTERN &pattern)
{
    return pattern.baPattern.size();
}

qint32 XBinaryForensics::getPatternLength(const TEXT_PATTERN &pattern)
{
    // Code points, not UTF-16 units
    return (qint32)pattern.sPattern.toUcs4().size();
}
