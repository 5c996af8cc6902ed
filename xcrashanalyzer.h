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
#ifndef XCRASHANALYZER_H
#define XCRASHANALYZER_H

#include "xcrashlogextractor.h"
#include "xpayloaddecoder.h"
#include "xsignaturesniffer.h"
#include "xminidumpheader.h"
#include "xbinaryforensics.h"
#include "xinflatedecoder.h"

class XCrashAnalyzer : public QObject {
    Q_OBJECT

public:
    struct OPTIONS {
        XBinaryForensics::OPTIONS forensicsOptions;
        XPayloadDecoder::OPTIONS decoderOptions;
        qint32 nNumberOfContextLines;
        bool bInflateStreams;
        qint64 nInflateLimit;
    };

    struct BUFFER_ANALYSIS {
        XSignatureSniffer::SIGNATURE signature;
        bool bIsHeaderPresent;
        XMiniDumpHeader::HEADER header;
        XBinaryForensics::FINDINGS findings;
        QByteArray baData;
    };

    struct REPORT {
        XCrashLogExtractor::LOG_CONTEXT context;
        bool bIsPayloadFound;
        qint32 nNumberOfPayloadLines;
        qint32 nEncodedLength;
        XPayloadDecoder::METHOD method;
        QList<XPayloadDecoder::ATTEMPT> listAttempts;
        bool bIsDecoded;
        BUFFER_ANALYSIS analysis;
        bool bIsRawAnalysisPresent;
        XPayloadDecoder::RAW_ANALYSIS rawAnalysis;
        bool bIsInflateAttempted;
        bool bIsInflated;
        XInflateDecoder::RESULT inflateResult;
        BUFFER_ANALYSIS inflated;
    };

    explicit XCrashAnalyzer(QObject *pParent = nullptr);

    static OPTIONS getDefaultOptions();
    REPORT analyze(const QString &sLog, const OPTIONS &options);
    static BUFFER_ANALYSIS analyzeBuffer(const QByteArray &baData, const XBinaryForensics::OPTIONS &forensicsOptions);
    static bool isInflateCandidate(const QByteArray &baData, XSignatureSniffer::SIGNATURE signature);

signals:
    void infoMessage(const QString &sText);
    void errorMessage(const QString &sText);
};

#endif  // XCRASHANALYZER_H
