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
#include "xbytereader.h"

XByteReader::XByteReader(const QByteArray &baData, qint64 nOffset) : m_baData(baData)
{
    m_nOffset = 0;

    seek(nOffset);
}

qint64 XByteReader::getSize() const
{
    return m_baData.size();
}

bool XByteReader::seek(qint64 nOffset)
{
    bool bResult = false;

    if ((nOffset >= 0) && (nOffset <= getSize())) {
        m_nOffset = nOffset;
        bResult = true;
    }

    return bResult;
}

bool XByteReader::read_uint32(quint32 *pnValue)
{
    bool bResult = _read_uint32(m_baData, m_nOffset, pnValue);

    if (bResult) {
        m_nOffset += 4;
    }

    return bResult;
}

bool XByteReader::_read_uint32(const QByteArray &baData, qint64 nOffset, quint32 *pnValue)
{
    bool bResult = false;

    if ((nOffset >= 0) && (nOffset + 4 <= baData.size())) {
        *pnValue = qFromLittleEndian<quint32>((const uchar *)(baData.constData() + nOffset));
        bResult = true;
    }

    return bResult;
}

bool XByteReader::_read_uint64(const QByteArray &baData, qint64 nOffset, quint64 *pnValue)
{
    bool bResult = false;

    if ((nOffset >= 0) && (nOffset + 8 <= baData.size())) {
        *pnValue = qFromLittleEndian<quint64>((const uchar *)(baData.constData() + nOffset));
        bResult = true;
    }

    return bResult;
}
