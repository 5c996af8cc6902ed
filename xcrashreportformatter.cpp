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
#include "xcrashreportformatter.h"

XCrashReportFormatter::XCrashReportFormatter(QObject *pParent) : QObject(pParent)
{
}

XCrashReportFormatter::OPTIONS XCrashReportFormatter::getDefaultOptions()
{
    OPTIONS result = {};

    result.nStringsLimit = 10;
    result.nAddressesLimit = 10;
    result.nPatternsLimit = 5;
    result.nHexDumpSize = 256;

    return result;
}

QString XCrashReportFormatter::toText(const XCrashAnalyzer::REPORT &report, const OPTIONS &options)
{
    QStringList listLines;

    listLines.append(tr("Crash context:"));

    if (report.context.bIsTimestampPresent) {
        listLines.append(QString("   %1: %2").arg(tr("Crash time"), report.context.sTimestamp));
    }

    if (report.context.bIsProcessIdPresent) {
        listLines.append(QString("   %1: %2").arg(tr("Process ID"), QString::number(report.context.nProcessId)));
    }

    if (!report.context.listContextLines.isEmpty()) {
        listLines.append(QString("   %1:").arg(tr("Log context (lines before crash)")));

        qint32 nNumberOfLines = report.context.listContextLines.size();

        for (qint32 i = 0; i < nNumberOfLines; i++) {
            listLines.append(QString("      %1").arg(report.context.listContextLines.at(i)));
        }
    }

    listLines.append(QString());

    if (!report.bIsPayloadFound) {
        listLines.append(tr("No payload found in the log"));
    } else {
        listLines.append(QString("%1: %2 %3 (%4 %5)")
                             .arg(tr("Found payload"), QString::number(report.nEncodedLength), tr("characters"), QString::number(report.nNumberOfPayloadLines),
                                  tr("lines")));

        qint32 nNumberOfAttempts = report.listAttempts.size();

        for (qint32 i = 0; i < nNumberOfAttempts; i++) {
            const XPayloadDecoder::ATTEMPT &attempt = report.listAttempts.at(i);

            if (attempt.method == XPayloadDecoder::METHOD_RAW) {
                listLines.append(QString("   %1").arg(XPayloadDecoder::methodToString(attempt.method)));
            } else if (attempt.bSuccess) {
                listLines.append(QString("   %1: %2 %3").arg(XPayloadDecoder::methodToString(attempt.method), QString::number(attempt.nDecodedSize), tr("bytes")));
            } else {
                listLines.append(QString("   %1: %2").arg(XPayloadDecoder::methodToString(attempt.method), attempt.sErrorString));
            }
        }
    }

    if (report.bIsDecoded) {
        listLines.append(QString());
        _appendBufferText(&listLines, report.analysis, options);

        if (report.bIsInflateAttempted) {
            listLines.append(QString());

            if (report.bIsInflated) {
                listLines.append(QString("%1 (%2):").arg(tr("Inflated stream"), XInflateDecoder::resultToString(report.inflateResult)));
                _appendBufferText(&listLines, report.inflated, options);
            } else {
                listLines.append(QString("%1: %2").arg(tr("Inflate failed"), XInflateDecoder::resultToString(report.inflateResult)));
            }
        }
    }

    if (report.bIsRawAnalysisPresent) {
        const XPayloadDecoder::RAW_ANALYSIS &raw = report.rawAnalysis;

        listLines.append(QString());
        listLines.append(tr("Could not fully decode the payload"));
        listLines.append(tr("Raw data analysis:"));
        listLines.append(QString("   %1: %2 %3").arg(tr("Length"), QString::number(raw.nLength), tr("characters")));
        listLines.append(QString("   %1: %2...").arg(tr("First characters"), raw.sHead));
        listLines.append(QString("   %1: ...%2").arg(tr("Last characters"), raw.sTail));
        listLines.append(tr("Character distribution:"));
        listLines.append(QString("   %1: %2 (%3%)").arg(tr("Printable ASCII"), QString::number(raw.nPrintableCount), QString::number(raw.dPrintablePercent, 'f', 1)));
        listLines.append(QString("   %1: %2 (%3%)").arg(tr("Digits"), QString::number(raw.nDigitCount), QString::number(raw.dDigitPercent, 'f', 1)));
        listLines.append(QString("   %1: %2 (%3%)").arg(tr("Letters"), QString::number(raw.nLetterCount), QString::number(raw.dLetterPercent, 'f', 1)));
        listLines.append(QString("   %1: %2 (%3%)").arg(tr("Special chars"), QString::number(raw.nSpecialCount), QString::number(raw.dSpecialPercent, 'f', 1)));

        if (!raw.listPatterns.isEmpty()) {
            listLines.append(tr("Common patterns found:"));

            qint32 nNumberOfPatterns = qMin((qint32)raw.listPatterns.size(), options.nPatternsLimit);

            for (qint32 i = 0; i < nNumberOfPatterns; i++) {
                listLines.append(QString("   '%1' %2 %3").arg(raw.listPatterns.at(i).sPattern, tr("appears"), QString::number(raw.listPatterns.at(i).nCount)));
            }
        }
    }

    return listLines.join(QChar('\n')) + QChar('\n');
}

QJsonObject XCrashReportFormatter::toJson(const XCrashAnalyzer::REPORT &report)
{
    QJsonObject jsonResult;

    QJsonObject jsonContext;

    if (report.context.bIsTimestampPresent) {
        jsonContext.insert("timestamp", report.context.sTimestamp);
    }

    if (report.context.bIsProcessIdPresent) {
        jsonContext.insert("processId", (double)report.context.nProcessId);
    }

    QJsonArray jsonContextLines;

    qint32 nNumberOfLines = report.context.listContextLines.size();

    for (qint32 i = 0; i < nNumberOfLines; i++) {
        jsonContextLines.append(report.context.listContextLines.at(i));
    }

    jsonContext.insert("lines", jsonContextLines);

    jsonResult.insert("context", jsonContext);
    jsonResult.insert("payloadFound", report.bIsPayloadFound);
    jsonResult.insert("payloadLines", report.nNumberOfPayloadLines);
    jsonResult.insert("encodedLength", report.nEncodedLength);
    jsonResult.insert("method", XPayloadDecoder::methodToString(report.method));
    jsonResult.insert("decoded", report.bIsDecoded);

    QJsonArray jsonAttempts;

    qint32 nNumberOfAttempts = report.listAttempts.size();

    for (qint32 i = 0; i < nNumberOfAttempts; i++) {
        const XPayloadDecoder::ATTEMPT &attempt = report.listAttempts.at(i);

        QJsonObject jsonAttempt;
        jsonAttempt.insert("method", XPayloadDecoder::methodToString(attempt.method));
        jsonAttempt.insert("success", attempt.bSuccess);

        if (!attempt.bSuccess) {
            jsonAttempt.insert("reason", XPayloadDecoder::declineReasonToString(attempt.declineReason));
            jsonAttempt.insert("error", attempt.sErrorString);
        } else if (attempt.method != XPayloadDecoder::METHOD_RAW) {
            jsonAttempt.insert("size", (double)attempt.nDecodedSize);
        }

        jsonAttempts.append(jsonAttempt);
    }

    jsonResult.insert("attempts", jsonAttempts);

    if (report.bIsDecoded) {
        jsonResult.insert("buffer", _bufferToJson(report.analysis));

        if (report.bIsInflateAttempted) {
            QJsonObject jsonInflate;
            jsonInflate.insert("result", XInflateDecoder::resultToString(report.inflateResult));

            if (report.bIsInflated) {
                jsonInflate.insert("buffer", _bufferToJson(report.inflated));
            }

            jsonResult.insert("inflate", jsonInflate);
        }
    }

    if (report.bIsRawAnalysisPresent) {
        const XPayloadDecoder::RAW_ANALYSIS &raw = report.rawAnalysis;

        QJsonObject jsonRaw;
        jsonRaw.insert("length", raw.nLength);
        jsonRaw.insert("head", raw.sHead);
        jsonRaw.insert("tail", raw.sTail);
        jsonRaw.insert("printable", raw.nPrintableCount);
        jsonRaw.insert("digits", raw.nDigitCount);
        jsonRaw.insert("letters", raw.nLetterCount);
        jsonRaw.insert("special", raw.nSpecialCount);
        jsonRaw.insert("printablePercent", raw.dPrintablePercent);
        jsonRaw.insert("digitsPercent", raw.dDigitPercent);
        jsonRaw.insert("lettersPercent", raw.dLetterPercent);
        jsonRaw.insert("specialPercent", raw.dSpecialPercent);

        QJsonArray jsonPatterns;

        qint32 nNumberOfPatterns = raw.listPatterns.size();

        for (qint32 i = 0; i < nNumberOfPatterns; i++) {
            QJsonObject jsonPattern;
            jsonPattern.insert("pattern", raw.listPatterns.at(i).sPattern);
            jsonPattern.insert("count", raw.listPatterns.at(i).nCount);
            jsonPatterns.append(jsonPattern);
        }

        jsonRaw.insert("patterns", jsonPatterns);

        jsonResult.insert("rawAnalysis", jsonRaw);
    }

    return jsonResult;
}

QList<QString> XCrashReportFormatter::getHexDump(const QByteArray &baData, qint32 nSize)
{
    QList<QString> listResult;

    qint32 nDumpSize = qMin((qint32)baData.size(), nSize);

    for (qint32 nOffset = 0; nOffset < nDumpSize; nOffset += 16) {
        qint32 nLineSize = qMin(16, nDumpSize - nOffset);

        QByteArray baLine = baData.mid(nOffset, nLineSize).toHex(' ');

        listResult.append(QString("%1: %2").arg(nOffset, 4, 16, QChar('0')).arg(QString::fromLatin1(baLine)));
    }

    return listResult;
}

QString XCrashReportFormatter::getEntropyVerdict(double dEntropy)
{
    QString sResult;

    if (XBinaryForensics::isHighEntropy(dEntropy)) {
        sResult = tr("compressed/encrypted");
    } else {
        sResult = tr("uncompressed");
    }

    return sResult;
}

void XCrashReportFormatter::_appendBufferText(QStringList *pListLines, const XCrashAnalyzer::BUFFER_ANALYSIS &analysis, const OPTIONS &options)
{
    const XBinaryForensics::FINDINGS &findings = analysis.findings;

    pListLines->append(QString("%1 (%2 %3):").arg(tr("Binary data analysis"), QString::number(findings.nSize), tr("bytes")));

    if (analysis.signature != XSignatureSniffer::SIGNATURE_UNKNOWN) {
        pListLines->append(QString("   %1: %2").arg(tr("Detected file type"), XSignatureSniffer::signatureToDescription(analysis.signature)));
    } else {
        pListLines->append(QString("   %1").arg(XSignatureSniffer::signatureToDescription(analysis.signature)));
    }

    if (analysis.bIsHeaderPresent) {
        const XMiniDumpHeader::HEADER &header = analysis.header;

        if (XMiniDumpHeader::isEmpty(header)) {
            pListLines->append(QString("   %1: %2").arg(tr("Header"), tr("no fields, buffer too short")));
        }

        if (header.bIsVersionPresent) {
            pListLines->append(QString("   %1: 0x%2").arg(tr("Version"), QString("%1").arg(header.nVersion, 8, 16, QChar('0'))));
        }

        if (header.bIsNumberOfStreamsPresent) {
            pListLines->append(QString("   %1: %2").arg(tr("Stream count"), QString::number(header.nNumberOfStreams)));
        }

        if (header.bIsStreamDirectoryRvaPresent) {
            pListLines->append(QString("   %1: 0x%2").arg(tr("Stream directory RVA"), QString("%1").arg(header.nStreamDirectoryRva, 8, 16, QChar('0'))));
        }
    }

    pListLines->append(QString("   %1: %2 (%3)").arg(tr("Entropy"), QString::number(findings.dEntropy, 'f', 3), getEntropyVerdict(findings.dEntropy)));

    QList<QString> listHexDump = getHexDump(analysis.baData, options.nHexDumpSize);

    if (!listHexDump.isEmpty()) {
        pListLines->append(QString("   %1 (%2 %3):").arg(tr("Hex dump"), tr("first"), QString::number(options.nHexDumpSize)));

        qint32 nNumberOfLines = listHexDump.size();

        for (qint32 i = 0; i < nNumberOfLines; i++) {
            pListLines->append(QString("      %1").arg(listHexDump.at(i)));
        }
    }

    qint32 nNumberOfStrings = findings.listStrings.size();

    if (nNumberOfStrings) {
        pListLines->append(QString("   %1 %2 %3:").arg(tr("Found"), QString::number(nNumberOfStrings), tr("printable strings")));

        qint32 nShown = qMin(nNumberOfStrings, options.nStringsLimit);

        for (qint32 i = 0; i < nShown; i++) {
            pListLines->append(QString("      '%1'").arg(findings.listStrings.at(i)));
        }

        if (nNumberOfStrings > nShown) {
            pListLines->append(QString("      ... %1 %2").arg(tr("and"), tr("%1 more").arg(nNumberOfStrings - nShown)));
        }
    }

    qint32 nNumberOfAddresses = findings.listAddresses.size();

    if (nNumberOfAddresses) {
        pListLines->append(QString("   %1 %2 %3:").arg(tr("Found"), QString::number(nNumberOfAddresses), tr("potential addresses")));

        qint32 nShown = qMin(nNumberOfAddresses, options.nAddressesLimit);

        for (qint32 i = 0; i < nShown; i++) {
            pListLines->append(QString("      %1").arg(_addressToString(findings.listAddresses.at(i))));
        }
    }

    qint32 nNumberOfHits = findings.listKeywordHits.size();

    if (nNumberOfHits) {
        pListLines->append(QString("   %1 %2 %3:").arg(tr("Found"), QString::number(nNumberOfHits), tr("crash-related patterns")));

        for (qint32 i = 0; i < nNumberOfHits; i++) {
            const XBinaryForensics::KEYWORD_HIT &hit = findings.listKeywordHits.at(i);

            pListLines->append(QString("      '%1' %2 %3: %4")
                                   .arg(hit.sKeyword, tr("at position"), QString::number(hit.nOffset), XBinaryForensics::getPrintableText(hit.baContext)));
        }
    }

    qint32 nNumberOfPatterns = findings.listPatterns.size();

    if (nNumberOfPatterns) {
        pListLines->append(QString("   %1:").arg(tr("Repeating patterns found")));

        qint32 nShown = qMin(nNumberOfPatterns, options.nPatternsLimit);

        for (qint32 i = 0; i < nShown; i++) {
            pListLines->append(QString("      %1: %2 %3")
                                   .arg(QString::fromLatin1(findings.listPatterns.at(i).baPattern.toHex()), QString::number(findings.listPatterns.at(i).nCount),
                                        tr("occurrences")));
        }
    }
}

QJsonObject XCrashReportFormatter::_bufferToJson(const XCrashAnalyzer::BUFFER_ANALYSIS &analysis)
{
    QJsonObject jsonResult;

    const XBinaryForensics::FINDINGS &findings = analysis.findings;

    jsonResult.insert("size", (double)findings.nSize);
    jsonResult.insert("signature", XSignatureSniffer::signatureToString(analysis.signature));

    if (analysis.bIsHeaderPresent) {
        QJsonObject jsonHeader;

        if (analysis.header.bIsVersionPresent) {
            jsonHeader.insert("version", (double)analysis.header.nVersion);
        }

        if (analysis.header.bIsNumberOfStreamsPresent) {
            jsonHeader.insert("streamCount", (double)analysis.header.nNumberOfStreams);
        }

        if (analysis.header.bIsStreamDirectoryRvaPresent) {
            jsonHeader.insert("streamDirectoryOffset", (double)analysis.header.nStreamDirectoryRva);
        }

        jsonResult.insert("header", jsonHeader);
    }

    jsonResult.insert("entropy", findings.dEntropy);
    jsonResult.insert("highEntropy", XBinaryForensics::isHighEntropy(findings.dEntropy));

    QJsonArray jsonPatterns;

    qint32 nNumberOfPatterns = findings.listPatterns.size();

    for (qint32 i = 0; i < nNumberOfPatterns; i++) {
        QJsonObject jsonPattern;
        jsonPattern.insert("pattern", QString::fromLatin1(findings.listPatterns.at(i).baPattern.toHex()));
        jsonPattern.insert("count", findings.listPatterns.at(i).nCount);
        jsonPatterns.append(jsonPattern);
    }

    jsonResult.insert("patterns", jsonPatterns);

    QJsonArray jsonStrings;

    qint32 nNumberOfStrings = findings.listStrings.size();

    for (qint32 i = 0; i < nNumberOfStrings; i++) {
        jsonStrings.append(findings.listStrings.at(i));
    }

    jsonResult.insert("strings", jsonStrings);

    // 64-bit values do not fit a JSON double, keep them as hex text
    QJsonArray jsonAddresses;

    qint32 nNumberOfAddresses = findings.listAddresses.size();

    for (qint32 i = 0; i < nNumberOfAddresses; i++) {
        jsonAddresses.append(_addressToString(findings.listAddresses.at(i)));
    }

    jsonResult.insert("addresses", jsonAddresses);

    QJsonArray jsonHits;

    qint32 nNumberOfHits = findings.listKeywordHits.size();

    for (qint32 i = 0; i < nNumberOfHits; i++) {
        const XBinaryForensics::KEYWORD_HIT &hit = findings.listKeywordHits.at(i);

        QJsonObject jsonHit;
        jsonHit.insert("keyword", hit.sKeyword);
        jsonHit.insert("offset", (double)hit.nOffset);
        jsonHit.insert("context", QString::fromLatin1(hit.baContext.toHex()));
        jsonHit.insert("contextText", XBinaryForensics::getPrintableText(hit.baContext));
        jsonHits.append(jsonHit);
    }

    jsonResult.insert("keywordHits", jsonHits);

    return jsonResult;
}

QString XCrashReportFormatter::_addressToString(quint64 nAddress)
{
    return QString("0x%1").arg(nAddress, 0, 16);
}
