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
#include "xcrashanalyzer.h"

XCrashAnalyzer::XCrashAnalyzer(QObject *pParent) : QObject(pParent)
{
}

XCrashAnalyzer::OPTIONS XCrashAnalyzer::getDefaultOptions()
{
    OPTIONS result = {};

    result.forensicsOptions = XBinaryForensics::getDefaultOptions();
    result.decoderOptions = XPayloadDecoder::getDefaultOptions();
    result.nNumberOfContextLines = 5;
    result.bInflateStreams = true;
    result.nInflateLimit = 1024 * 1024;

    return result;
}

XCrashAnalyzer::REPORT XCrashAnalyzer::analyze(const QString &sLog, const OPTIONS &options)
{
    REPORT result = {};

    result.method = XPayloadDecoder::METHOD_UNKNOWN;
    result.analysis.signature = XSignatureSniffer::SIGNATURE_UNKNOWN;
    result.inflated.signature = XSignatureSniffer::SIGNATURE_UNKNOWN;

    // Context does not depend on the payload
    result.context = XCrashLogExtractor::getLogContext(sLog, options.nNumberOfContextLines);

    emit infoMessage(tr("Extracting payload..."));

    XCrashLogExtractor::PAYLOAD payload = XCrashLogExtractor::extractPayload(sLog);

    result.bIsPayloadFound = payload.bIsFound;
    result.nNumberOfPayloadLines = payload.nNumberOfLines;
    result.nEncodedLength = payload.sEncoded.size();

    if (!payload.bIsFound) {
        emit errorMessage(tr("No payload found in the log"));
    } else if (payload.sEncoded.isEmpty()) {
        emit errorMessage(tr("Payload is empty"));
    } else {
        emit infoMessage(tr("Found payload: %1 characters").arg(payload.sEncoded.size()));

        XPayloadDecoder decoder;
        connect(&decoder, SIGNAL(infoMessage(QString)), this, SIGNAL(infoMessage(QString)));
        connect(&decoder, SIGNAL(errorMessage(QString)), this, SIGNAL(errorMessage(QString)));

        XPayloadDecoder::RESULT decodeResult = decoder.decode(payload.sEncoded, options.decoderOptions);

        result.method = decodeResult.method;
        result.listAttempts = decodeResult.listAttempts;
        result.bIsDecoded = decodeResult.bIsDecoded;
        result.bIsRawAnalysisPresent = decodeResult.bIsRawAnalysisPresent;
        result.rawAnalysis = decodeResult.rawAnalysis;

        if (decodeResult.bIsDecoded) {
            result.analysis = analyzeBuffer(decodeResult.baData, options.forensicsOptions);

            emit infoMessage(tr("Detected file type: %1").arg(XSignatureSniffer::signatureToDescription(result.analysis.signature)));

            if (options.bInflateStreams && isInflateCandidate(result.analysis.baData, result.analysis.signature)) {
                QByteArray baInflated;
                result.bIsInflateAttempted = true;
                result.inflateResult = XInflateDecoder::decompress(result.analysis.baData, &baInflated, options.nInflateLimit);

                // A cut or truncated stream still carries usable bytes
                if ((result.inflateResult != XInflateDecoder::RESULT_INITERROR) && (result.inflateResult != XInflateDecoder::RESULT_DATAERROR) &&
                    (!baInflated.isEmpty())) {
                    result.bIsInflated = true;
                    result.inflated = analyzeBuffer(baInflated, options.forensicsOptions);

                    emit infoMessage(tr("Inflated %1 bytes: %2").arg(QString::number(baInflated.size()), XInflateDecoder::resultToString(result.inflateResult)));
                } else {
                    emit errorMessage(tr("Inflate failed: %1").arg(XInflateDecoder::resultToString(result.inflateResult)));
                }
            }
        } else {
            emit errorMessage(tr("Could not fully decode the payload"));
        }
    }

    return result;
}

XCrashAnalyzer::BUFFER_ANALYSIS XCrashAnalyzer::analyzeBuffer(const QByteArray &baData, const XBinaryForensics::OPTIONS &forensicsOptions)
{
    BUFFER_ANALYSIS result = {};

    result.baData = baData;
    result.signature = XSignatureSniffer::getSignature(baData);

    if (XMiniDumpHeader::isSignaturePresent(baData)) {
        result.bIsHeaderPresent = true;
        result.header = XMiniDumpHeader::read_HEADER(baData);
    }

    // Runs for every container, minidumps included
    result.findings = XBinaryForensics::analyze(baData, forensicsOptions);

    return result;
}

bool XCrashAnalyzer::isInflateCandidate(const QByteArray &baData, XSignatureSniffer::SIGNATURE signature)
{
    bool bResult = false;

    if (signature == XSignatureSniffer::SIGNATURE_UNKNOWN) {
        bResult = XSignatureSniffer::isZlibStream(baData) || XSignatureSniffer::isGzipStream(baData);
    }

    return bResult;
}
