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
#include "xinflatedecoder.h"

XInflateDecoder::XInflateDecoder(QObject *parent) : QObject(parent)
{
}

XInflateDecoder::RESULT XInflateDecoder::decompress(const QByteArray &baInput, QByteArray *pbaOutput, qint64 nLimit)
{
    RESULT result = RESULT_TRUNCATED;

    pbaOutput->clear();

    z_stream strm = {};
    strm.next_in = (Bytef *)baInput.constData();
    strm.avail_in = (uInt)baInput.size();

    // 15 + 32: max window, zlib or gzip header
    if (inflateInit2(&strm, 15 + 32) == Z_OK) {
        QByteArray baBuffer(INFLATE_BUFFERSIZE, 0);

        while (true) {
            strm.next_out = (Bytef *)baBuffer.data();
            strm.avail_out = (uInt)baBuffer.size();

            qint32 nRet = inflate(&strm, Z_NO_FLUSH);

            if ((nRet != Z_OK) && (nRet != Z_STREAM_END) && (nRet != Z_BUF_ERROR)) {
                result = RESULT_DATAERROR;
                break;
            }

            qint64 nHave = baBuffer.size() - strm.avail_out;

            if (nHave > 0) {
                if ((nLimit >= 0) && (pbaOutput->size() + nHave > nLimit)) {
                    pbaOutput->append(baBuffer.constData(), (int)(nLimit - pbaOutput->size()));
                    result = RESULT_LIMIT;
                    break;
                }

                pbaOutput->append(baBuffer.constData(), (int)nHave);
            }

            if (nRet == Z_STREAM_END) {
                result = RESULT_OK;
                break;
            }

            if ((nHave == 0) && (strm.avail_in == 0)) {
                // Input exhausted in the middle of the stream
                result = RESULT_TRUNCATED;
                break;
            }
        }

        inflateEnd(&strm);
    } else {
        result = RESULT_INITERROR;
    }

#ifdef QT_DEBUG
    qDebug("XInflateDecoder::decompress: in=%lld out=%lld result=%d", (qint64)baInput.size(), (qint64)pbaOutput->size(), result);
#endif

    return result;
}

QString XInflateDecoder::resultToString(RESULT result)
{
    QString sResult;

    switch (result) {
        case RESULT_OK: sResult = tr("OK"); break;
        case RESULT_INITERROR: sResult = tr("Cannot initialize inflate"); break;
        case RESULT_DATAERROR: sResult = tr("Data error"); break;
        case RESULT_TRUNCATED: sResult = tr("Truncated stream"); break;
        case RESULT_LIMIT: sResult = tr("Output limit reached"); break;
    }

    return sResult;
}
