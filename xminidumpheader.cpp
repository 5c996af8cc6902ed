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
#include "xminidumpheader.h"

XMiniDumpHeader::XMiniDumpHeader(QObject *pParent) : QObject(pParent)
{
}

bool XMiniDumpHeader::isSignaturePresent(const QByteArray &baData)
{
    quint32 nSignature = 0;

    return XByteReader::_read_uint32(baData, 0, &nSignature) && (nSignature == MINIDUMP_SIGNATURE);
}

XMiniDumpHeader::HEADER XMiniDumpHeader::read_HEADER(const QByteArray &baData)
{
    HEADER result = {};

    XByteReader reader(baData);

    // Fields are independent: a short buffer drops the tail only
    if (reader.seek(MINIDUMP_HEADER_FIELDS_OFFSET)) {
        result.bIsVersionPresent = reader.read_uint32(&result.nVersion);
        result.bIsNumberOfStreamsPresent = reader.read_uint32(&result.nNumberOfStreams);
        result.bIsStreamDirectoryRvaPresent = reader.read_uint32(&result.nStreamDirectoryRva);
    }

#ifdef QT_DEBUG
    qDebug("XMiniDumpHeader::read_HEADER: size=%lld version=%d streams=%d rva=%d", (qint64)baData.size(), result.bIsVersionPresent,
           result.bIsNumberOfStreamsPresent, result.bIsStreamDirectoryRvaPresent);
#endif

    return result;
}

bool XMiniDumpHeader::isEmpty(const HEADER &header)
{
    return !(header.bIsVersionPresent || header.bIsNumberOfStreamsPresent || header.bIsStreamDirectoryRvaPresent);
}
