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

#include <QRegularExpression>

const char *XCrashLogExtractor::PAYLOAD_MARKER = "F crashpad:";
const char *XCrashLogExtractor::PAYLOAD_LINE_PATTERN = "F crashpad: ([^$\\n]+)";
const char *XCrashLogExtractor::PAYLOAD_BEGIN = "-----BEGIN CRASHPAD MINIDUMP-----";
const char *XCrashLogExtractor::PAYLOAD_END = "-----END CRASHPAD MINIDUMP-----";
const char *XCrashLogExtractor::TIMESTAMP_PATTERN = "(\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}\\.\\d{3})";
const char *XCrashLogExtractor::PROCESSID_PATTERN = "(\\d+)\\s+\\d+\\s+F crashpad:";

XCrashLogExtractor::XCrashLogExtractor(QObject *pParent) : QObject(pParent)
{
}

XCrashLogExtractor::PAYLOAD XCrashLogExtractor::extractPayload(const QString &sLog)
{
    PAYLOAD result = {};

    QRegularExpression regExp(QString::fromLatin1(PAYLOAD_LINE_PATTERN));
    QRegularExpressionMatchIterator iter = regExp.globalMatch(sLog);

    QString sEncoded;

    while (iter.hasNext()) {
        QRegularExpressionMatch match = iter.next();

        sEncoded.append(match.captured(1));
        result.nNumberOfLines++;
    }

    if (result.nNumberOfLines > 0) {
        sEncoded.remove(QString::fromLatin1(PAYLOAD_BEGIN));
        sEncoded.remove(QString::fromLatin1(PAYLOAD_END));

        result.bIsFound = true;
        result.sEncoded = sEncoded.trimmed();
    }

#ifdef QT_DEBUG
    qDebug("XCrashLogExtractor::extractPayload: lines=%d length=%d", result.nNumberOfLines, (qint32)result.sEncoded.size());
#endif

    return result;
}

XCrashLogExtractor::LOG_CONTEXT XCrashLogExtractor::getLogContext(const QString &sLog, qint32 nNumberOfContextLines)
{
    LOG_CONTEXT result = {};

    result.bIsTimestampPresent = getTimestamp(sLog, &result.sTimestamp);
    result.bIsProcessIdPresent = getProcessId(sLog, &result.nProcessId);
    result.nMarkerLineIndex = -1;

    QList<QString> listLines = sLog.split(QChar('\n'));

    qint32 nNumberOfLines = listLines.size();

    for (qint32 i = 0; i < nNumberOfLines; i++) {
        if (listLines.at(i).contains(QString::fromLatin1(PAYLOAD_MARKER))) {
            result.nMarkerLineIndex = i;
            break;
        }
    }

    // Nothing precedes a marker on the first line
    if (result.nMarkerLineIndex > 0) {
        qint32 nStart = qMax(0, result.nMarkerLineIndex - nNumberOfContextLines);

        for (qint32 i = nStart; i < result.nMarkerLineIndex; i++) {
            QString sLine = listLines.at(i);

            if (sLine.endsWith(QChar('\r'))) {
                sLine.chop(1);
            }

            if (!sLine.trimmed().isEmpty()) {
                result.listContextLines.append(sLine);
            }
        }
    }

    return result;
}

bool XCrashLogExtractor::getTimestamp(const QString &sLog, QString *psTimestamp)
{
    bool bResult = false;

    QRegularExpression regExp(QString::fromLatin1(TIMESTAMP_PATTERN));
    QRegularExpressionMatch match = regExp.match(sLog);

    if (match.hasMatch()) {
        *psTimestamp = match.captured(1);
        bResult = true;
    }

    return bResult;
}

bool XCrashLogExtractor::getProcessId(const QString &sLog, qint64 *pnProcessId)
{
    bool bResult = false;

    QRegularExpression regExp(QString::fromLatin1(PROCESSID_PATTERN));
    QRegularExpressionMatch match = regExp.match(sLog);

    if (match.hasMatch()) {
        *pnProcessId = match.captured(1).toLongLong(&bResult);
    }

    return bResult;
}
