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
#include "xbase64decoder.h"

XBase64Decoder::XBase64Decoder(QObject *parent) : QObject(parent)
{
}

// Data characters plus the padding character
bool XBase64Decoder::isAlphabetChar(QChar cChar)
{
    ushort nUnicode = cChar.unicode();

    return ((nUnicode >= 'A') && (nUnicode <= 'Z')) || ((nUnicode >= 'a') && (nUnicode <= 'z')) || ((nUnicode >= '0') && (nUnicode <= '9')) ||
           (nUnicode == '+') || (nUnicode == '/') || (nUnicode == '=');
}

QByteArray XBase64Decoder::clean(const QString &sText)
{
    QByteArray baResult;

    qint32 nSize = sText.size();

    baResult.reserve(nSize);

    for (qint32 i = 0; i < nSize; i++) {
        QChar cChar = sText.at(i);

        if (isAlphabetChar(cChar)) {
            baResult.append((char)cChar.unicode());
        }
    }

    return baResult;
}

// Lenient RFC 4648 decoding.
// A padding character that completes a quantum ends the data, anything after it is ignored.
// Padding that does not complete a quantum is skipped. Characters outside the alphabet are skipped.
// A trailing partial quantum without padding is an error.
XBase64Decoder::STATUS XBase64Decoder::decode(const QByteArray &baInput, QByteArray *pbaOutput, qint32 *pnDataChars)
{
    STATUS result = STATUS_OK;

    pbaOutput->clear();
    pbaOutput->reserve((baInput.size() / 4) * 3 + 3);

    qint32 nQuadPos = 0;
    qint32 nPads = 0;
    qint32 nDataChars = 0;
    quint32 nLeftChar = 0;
    bool bDone = false;

    qint32 nSize = baInput.size();

    for (qint32 i = 0; (i < nSize) && (!bDone); i++) {
        char cChar = baInput.at(i);

        if (cChar == '=') {
            nPads++;

            if ((nQuadPos >= 2) && (nQuadPos + nPads >= 4)) {
                bDone = true;
            }

            continue;
        }

        qint32 nValue = _getValue(cChar);

        if (nValue < 0) {
            continue;
        }

        nPads = 0;
        nDataChars++;

        switch (nQuadPos) {
            case 0:
                nLeftChar = (quint32)nValue;
                nQuadPos = 1;
                break;
            case 1:
                pbaOutput->append((char)((nLeftChar << 2) | (nValue >> 4)));
                nLeftChar = (quint32)nValue & 0x0F;
                nQuadPos = 2;
                break;
            case 2:
                pbaOutput->append((char)((nLeftChar << 4) | (nValue >> 2)));
                nLeftChar = (quint32)nValue & 0x03;
                nQuadPos = 3;
                break;
            case 3:
                pbaOutput->append((char)((nLeftChar << 6) | nValue));
                nLeftChar = 0;
                nQuadPos = 0;
                break;
        }
    }

    if ((!bDone) && (nQuadPos != 0)) {
        if (nQuadPos == 1) {
            result = STATUS_EXCESSDATA;
        } else {
            result = STATUS_INCORRECTPADDING;
        }

        pbaOutput->clear();
    }

    if (pnDataChars) {
        *pnDataChars = nDataChars;
    }

    return result;
}

QString XBase64Decoder::statusToString(STATUS status, qint32 nDataChars)
{
    QString sResult;

    if (status == STATUS_EXCESSDATA) {
        sResult = tr("Invalid base64-encoded string: number of data characters (%1) cannot be 1 more than a multiple of 4").arg(nDataChars);
    } else if (status == STATUS_INCORRECTPADDING) {
        sResult = tr("Incorrect padding");
    }

    return sResult;
}

qint32 XBase64Decoder::_getValue(char cChar)
{
    qint32 nResult = -1;

    if ((cChar >= 'A') && (cChar <= 'Z')) {
        nResult = cChar - 'A';
    } else if ((cChar >= 'a') && (cChar <= 'z')) {
        nResult = cChar - 'a' + 26;
    } else if ((cChar >= '0') && (cChar <= '9')) {
        nResult = cChar - '0' + 52;
    } else if (cChar == '+') {
        nResult = 62;
    } else if (cChar == '/') {
        nResult = 63;
    }

    return nResult;
}
