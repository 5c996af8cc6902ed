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
#ifndef XINFLATEDECODER_H
#define XINFLATEDECODER_H

#include <QObject>
#include <QByteArray>

#include "zlib.h"

class XInflateDecoder : public QObject {
    Q_OBJECT

public:
    enum RESULT {
        RESULT_OK = 0,
        RESULT_INITERROR,
        RESULT_DATAERROR,
        RESULT_TRUNCATED,  // Stream ended before Z_STREAM_END
        RESULT_LIMIT       // Output reached the limit, result is cut
    };

    static const qint32 INFLATE_BUFFERSIZE = 0x4000;

    explicit XInflateDecoder(QObject *parent = nullptr);

    // Accepts zlib and gzip framing (header autodetect)
    static RESULT decompress(const QByteArray &baInput, QByteArray *pbaOutput, qint64 nLimit = -1);
    static QString resultToString(RESULT result);
};

#endif  // XINFLATEDECODER_H
