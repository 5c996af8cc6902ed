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
#ifndef XSIGNATURESNIFFER_H
#define XSIGNATURESNIFFER_H

#include <QObject>
#include <QByteArray>
#include <QString>

class XSignatureSniffer : public QObject {
    Q_OBJECT

public:
    enum SIGNATURE {
        SIGNATURE_UNKNOWN = 0,
        SIGNATURE_MINIDUMP,
        SIGNATURE_ELF,
        SIGNATURE_ZIP,
        SIGNATURE_PNG,
        SIGNATURE_GIF,
        SIGNATURE_JPEG
    };

    struct SIGNATURE_RECORD {
        const char *pszPrefix;
        qint32 nPrefixSize;
        SIGNATURE signature;
        const char *pszDescription;
    };

    explicit XSignatureSniffer(QObject *pParent = nullptr);

    static SIGNATURE getSignature(const QByteArray &baData);
    static bool isPrefixPresent(const QByteArray &baData, const char *pszPrefix, qint32 nPrefixSize);
    static QString signatureToString(SIGNATURE signature);
    static QString signatureToDescription(SIGNATURE signature);
    static bool isZlibStream(const QByteArray &baData);
    static bool isGzipStream(const QByteArray &baData);
};

#endif  // XSIGNATURESNIFFER_H
