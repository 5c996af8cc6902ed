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
#ifndef XBASE64DECODER_H
#define XBASE64DECODER_H

#include <QObject>
#include <QByteArray>
#include <QString>

class XBase64Decoder : public QObject {
    Q_OBJECT

public:
    enum STATUS {
        STATUS_OK = 0,
        STATUS_EXCESSDATA,       // One data character left over
        STATUS_INCORRECTPADDING  // Two or three data characters left over without padding
    };

    explicit XBase64Decoder(QObject *parent = nullptr);

    static bool isAlphabetChar(QChar cChar);
    static QByteArray clean(const QString &sText);
    static STATUS decode(const QByteArray &baInput, QByteArray *pbaOutput, qint32 *pnDataChars = nullptr);
    static QString statusToString(STATUS status, qint32 nDataChars = 0);

private:
    static qint32 _getValue(char cChar);
};

#endif  // XBASE64DECODER_H
