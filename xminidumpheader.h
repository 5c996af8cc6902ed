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
#ifndef XMINIDUMPHEADER_H
#define XMINIDUMPHEADER_H

#include <QObject>

#include "xbytereader.h"

class XMiniDumpHeader : public QObject {
    Q_OBJECT

public:
    /*!
        \brief Shallow reader for the fixed part of a minidump header.
        Only the fields in front of the stream directory are read. The directory itself is not walked
        and its offset is not checked against the buffer size.
    */
    static const quint32 MINIDUMP_SIGNATURE = 0x504D444D;  // 'MDMP'
    static const qint64 MINIDUMP_HEADER_FIELDS_OFFSET = 4;

    struct HEADER {
        bool bIsVersionPresent;
        quint32 nVersion;
        bool bIsNumberOfStreamsPresent;
        quint32 nNumberOfStreams;
        bool bIsStreamDirectoryRvaPresent;
        quint32 nStreamDirectoryRva;  // Byte offset from the start of the buffer
    };

    explicit XMiniDumpHeader(QObject *pParent = nullptr);

    static bool isSignaturePresent(const QByteArray &baData);
    static HEADER read_HEADER(const QByteArray &baData);
    static bool isEmpty(const HEADER &header);
};

#endif  // XMINIDUMPHEADER_H
