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
#ifndef XCRASHREPORTFORMATTER_H
#define XCRASHREPORTFORMATTER_H

#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>

#include "xcrashanalyzer.h"

class XCrashReportFormatter : public QObject {
    Q_OBJECT

public:
    struct OPTIONS {
        qint32 nStringsLimit;
        qint32 nAddressesLimit;
        qint32 nPatternsLimit;
        qint32 nHexDumpSize;
    };

    explicit XCrashReportFormatter(QObject *pParent = nullptr);

    static OPTIONS getDefaultOptions();
    static QString toText(const XCrashAnalyzer::REPORT &report, const OPTIONS &options);
    static QJsonObject toJson(const XCrashAnalyzer::REPORT &report);

    static QList<QString> getHexDump(const QByteArray &baData, qint32 nSize = 256);
    static QString getEntropyVerdict(double dEntropy);

private:
    static void _appendBufferText(QStringList *pListLines, const XCrashAnalyzer::BUFFER_ANALYSIS &analysis, const OPTIONS &options);
    static QJsonObject _bufferToJson(const XCrashAnalyzer::BUFFER_ANALYSIS &analysis);
    static QString _addressToString(quint64 nAddress);
};

#endif  // XCRASHREPORTFORMATTER_H
