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
#ifndef XCRASHLOGEXTRACTOR_H
#define XCRASHLOGEXTRACTOR_H

#include <QObject>
#include <QList>
#include <QString>

class XCrashLogExtractor : public QObject {
    Q_OBJECT

public:
    // Text conventions of the crash handler output, must match exactly
    static const char *PAYLOAD_MARKER;
    static const char *PAYLOAD_LINE_PATTERN;
    static const char *PAYLOAD_BEGIN;
    static const char *PAYLOAD_END;
    static const char *TIMESTAMP_PATTERN;
    static const char *PROCESSID_PATTERN;

    struct PAYLOAD {
        bool bIsFound;
        qint32 nNumberOfLines;
        QString sEncoded;
    };

    struct LOG_CONTEXT {
        bool bIsTimestampPresent;
        QString sTimestamp;
        bool bIsProcessIdPresent;
        qint64 nProcessId;
        qint32 nMarkerLineIndex;  // -1 if there is no marker line
        QList<QString> listContextLines;
    };

    explicit XCrashLogExtractor(QObject *pParent = nullptr);

    static PAYLOAD extractPayload(const QString &sLog);
    static LOG_CONTEXT getLogContext(const QString &sLog, qint32 nNumberOfContextLines = 5);
    static bool getTimestamp(const QString &sLog, QString *psTimestamp);
    static bool getProcessId(const QString &sLog, qint64 *pnProcessId);
};

#endif  // XCRASHLOGEXTRACTOR_H
