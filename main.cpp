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
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>

#include "xcrashreportformatter.h"

class ConsoleOutput : public QObject {
    Q_OBJECT

public slots:
    void infoMessage(const QString &sText)
    {
        QTextStream(stderr) << sText << "\n";
    }

    void errorMessage(const QString &sText)
    {
        QTextStream(stderr) << "[!] " << sText << "\n";
    }
};

static bool readLog(const QCommandLineParser &parser, QString *psLog)
{
    bool bResult = false;

    QStringList listArguments = parser.positionalArguments();

    if (parser.isSet("file")) {
        QFile file;
        file.setFileName(parser.value("file"));

        if (file.open(QIODevice::ReadOnly)) {
            *psLog = QString::fromUtf8(file.readAll());
            bResult = true;

            file.close();
        } else {
            QTextStream(stderr) << QString("Cannot open file: %1").arg(parser.value("file")) << "\n";
        }
    } else if ((listArguments.size() == 1) && (listArguments.at(0) != "-")) {
        *psLog = listArguments.at(0);
        bResult = true;
    } else {
        QFile file;

        if (file.open(stdin, QIODevice::ReadOnly)) {
            *psLog = QString::fromUtf8(file.readAll());
            bResult = true;

            file.close();
        }
    }

    return bResult;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("xcrashanalyzer");
    QCoreApplication::setApplicationVersion("1.00");

    QCommandLineParser parser;
    parser.setApplicationDescription("Decodes and analyzes crash dump payloads embedded in Android logs");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("log", "Log text, or '-' to read standard input");

    QCommandLineOption optionFile(QStringList() << "f" << "file", "Read the log from <file>.", "file");
    QCommandLineOption optionJson(QStringList() << "j" << "json", "Print the report as JSON.");
    QCommandLineOption optionMinStringLength("min-string-length", "Minimum length of extracted strings.", "length", "4");
    QCommandLineOption optionPatternLimit("pattern-limit", "Keep at most <count> repeating patterns (-1 keeps all).", "count", "-1");
    QCommandLineOption optionNoInflate("no-inflate", "Do not inflate zlib/gzip payloads.");
    QCommandLineOption optionVerbose(QStringList() << "v" << "verbose", "Print progress messages to stderr.");

    parser.addOption(optionFile);
    parser.addOption(optionJson);
    parser.addOption(optionMinStringLength);
    parser.addOption(optionPatternLimit);
    parser.addOption(optionNoInflate);
    parser.addOption(optionVerbose);

    parser.process(app);

    QString sLog;

    if (!readLog(parser, &sLog)) {
        return 1;
    }

    XCrashAnalyzer::OPTIONS options = XCrashAnalyzer::getDefaultOptions();

    bool bIsNumber = false;
    qint32 nMinStringLength = parser.value(optionMinStringLength).toInt(&bIsNumber);

    if (bIsNumber && (nMinStringLength > 0)) {
        options.forensicsOptions.nMinStringLength = nMinStringLength;
    }

    qint32 nPatternLimit = parser.value(optionPatternLimit).toInt(&bIsNumber);

    if (bIsNumber) {
        options.forensicsOptions.nPatternLimit = nPatternLimit;
        options.decoderOptions.nTextPatternLimit = nPatternLimit;
    }

    options.bInflateStreams = !parser.isSet(optionNoInflate);

    XCrashAnalyzer analyzer;
    ConsoleOutput consoleOutput;

    if (parser.isSet(optionVerbose)) {
        QObject::connect(&analyzer, SIGNAL(infoMessage(QString)), &consoleOutput, SLOT(infoMessage(QString)));
        QObject::connect(&analyzer, SIGNAL(errorMessage(QString)), &consoleOutput, SLOT(errorMessage(QString)));
    }

    XCrashAnalyzer::REPORT report = analyzer.analyze(sLog, options);

    QTextStream out(stdout);

    if (parser.isSet(optionJson)) {
        out << QJsonDocument(XCrashReportFormatter::toJson(report)).toJson(QJsonDocument::Indented);
    } else {
        out << XCrashReportFormatter::toText(report, XCrashReportFormatter::getDefaultOptions());
    }

    return 0;
}

#include "main.moc"
