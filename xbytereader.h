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
#ifndef XBYTEREADER_H
#define XBYTEREADER_H

#include <QByteArray>
#include <QtEndian>

// Forward-only little-endian reader over an in-memory buffer.
// Every read checks the bounds first and moves the cursor only if the whole value fits.
class XByteReader {
public:
    explicit XByteReader(const QByteArray &baData, qint64 nOffset = 0);

    qint64 getSize() const;
    bool seek(qint64 nOffset);

    bool read_uint32(quint32 *pnValue);

    // Random access, cursor is not touched
    static bool _read_uint32(const QByteArray &baData, qint64 nOffset, quint32 *pnValue);
    static bool _read_uint64(const QByteArray &baData, qint64 nOffset, quint64 *pnValue);

private:
    QByteArray m_baData;  // Shared copy, outlives a temporary argument
    qint64 m_nOffset;
};

#endif  // XBYTEREADER_H
