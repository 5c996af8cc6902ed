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
#ifndef XBINARYFORENSICS_H
#define XBINARYFORENSICS_H

#include <QObject>
#include <QByteArray>
#include <QList>
#include <QString>

#include <algorithm>

class XBinaryForensics : public QObject {
    Q_OBJECT

public:
    static const quint64 ADDRESS32_MIN = 0x10000000;
    static const quint64 ADDRESS32_MAX = 0xFFFFFFFF;
    static const quint64 ADDRESS64_MIN = 0x100000000ULL;
    static const quint64 ADDRESS64_MAX = 0x7FFFFFFFFFFFULL;

    struct OPTIONS {
        qint32 nMinStringLength;
        qint32 nMinPatternLength;
        qint32 nMaxPatternLength;
        qint32 nPatternLimit;  // -1 no limit
        qint32 nKeywordContextSize;
    };

    struct PATTERN {
        QByteArray baPattern;
        qint32 nCount;
    };

    struct TEXT_PATTERN {
        QString sPattern;
        qint32 nCount;
    };

    struct KEYWORD_HIT {
        QString sKeyword;
        qint64 nOffset;  // First occurrence
        qint64 nContextOffset;
        QByteArray baContext;
    };

    struct FINDINGS {
        qint64 nSize;
        double dEntropy;
        QList<PATTERN> listPatterns;
        QList<QString> listStrings;
        QList<quint64> listAddresses;  // Unique, ascending
        QList<KEYWORD_HIT> listKeywordHits;
    };

    explicit XBinaryForensics(QObject *pParent = nullptr);

    static OPTIONS getDefaultOptions();
    static FINDINGS analyze(const QByteArray &baData, const OPTIONS &options);

    static bool isPrintable(quint8 nByte);
    static double getEntropy(const QByteArray &baData);
    static bool isHighEntropy(double dEntropy);
    static QList<PATTERN> getRepeatingPatterns(const QByteArray &baData, qint32 nMinLength, qint32 nMaxLength, qint32 nLimit = -1);
    static QList<QString> getPrintableStrings(const QByteArray &baData, qint32 nMinLength = 4);
    static QList<quint64> getCandidateAddresses(const QByteArray &baData);
    static QList<QByteArray> getCrashKeywords();
    static QList<KEYWORD_HIT> getKeywordHits(const QByteArray &baData, qint32 nContextSize = 10);
    static QString getPrintableText(const QByteArray &baData, char cReplace = '.');

    static qint32 getPatternLength(const PATTERN &pattern);
    static qint32 getPatternLength(const TEXT_PATTERN &pattern);

    // Count descending, then length descending. Stable, so equal keys keep discovery order.
    template <class T>
    static void sortPatterns(QList<T> *pListPatterns)
    {
        std::stable_sort(pListPatterns->begin(), pListPatterns->end(), [](const T &pattern1, const T &pattern2) {
            if (pattern1.nCount != pattern2.nCount) {
                return pattern1.nCount > pattern2.nCount;
            }

            return XBinaryForensics::getPatternLength(pattern1) > XBinaryForensics::getPatternLength(pattern2);
        });
    }
};

#endif  // XBINARYFORENSICS_H
