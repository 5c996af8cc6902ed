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
#include "xsignaturesniffer.h"

#include <string.h>

// Order matters: first match wins. "\x7fELF" goes before the bare "ELF".
static const XSignatureSniffer::SIGNATURE_RECORD _TABLE_XSIGNATURESNIFFER_SIGNATURES[] = {
    {"MDMP", 4, XSignatureSniffer::SIGNATURE_MINIDUMP, "Windows Minidump"},  {"\x7f" "ELF", 4, XSignatureSniffer::SIGNATURE_ELF, "ELF executable"},
    {"ELF", 3, XSignatureSniffer::SIGNATURE_ELF, "ELF executable"},          {"PK", 2, XSignatureSniffer::SIGNATURE_ZIP, "ZIP/APK archive"},
    {"\x89" "PNG", 4, XSignatureSniffer::SIGNATURE_PNG, "PNG image"},        {"GIF8", 4, XSignatureSniffer::SIGNATURE_GIF, "GIF image"},
    {"\xFF\xD8\xFF", 3, XSignatureSniffer::SIGNATURE_JPEG, "JPEG image"},
};

XSignatureSniffer::XSignatureSniffer(QObject *pParent) : QObject(pParent)
{
}

XSignatureSniffer::SIGNATURE XSignatureSniffer::getSignature(const QByteArray &baData)
{
    SIGNATURE result = SIGNATURE_UNKNOWN;

    qint32 nNumberOfRecords = sizeof(_TABLE_XSIGNATURESNIFFER_SIGNATURES) / sizeof(SIGNATURE_RECORD);

    for (qint32 i = 0; i < nNumberOfRecords; i++) {
        const SIGNATURE_RECORD &record = _TABLE_XSIGNATURESNIFFER_SIGNATURES[i];

        if (isPrefixPresent(baData, record.pszPrefix, record.nPrefixSize)) {
            result = record.signature;
            break;
        }
    }

    return result;
}

bool XSignatureSniffer::isPrefixPresent(const QByteArray &baData, const char *pszPrefix, qint32 nPrefixSize)
{
    bool bResult = false;

    if (baData.size() >= nPrefixSize) {
        bResult = (memcmp(baData.constData(), pszPrefix, nPrefixSize) == 0);
    }

    return bResult;
}

QString XSignatureSniffer::signatureToString(SIGNATURE signature)
{
    QString sResult = QString("Unknown");

    switch (signature) {
        case SIGNATURE_MINIDUMP: sResult = QString("Minidump"); break;
        case SIGNATURE_ELF: sResult = QString("ELF"); break;
        case SIGNATURE_ZIP: sResult = QString("ZipArchive"); break;
        case SIGNATURE_PNG: sResult = QString("Png"); break;
        case SIGNATURE_GIF: sResult = QString("Gif"); break;
        case SIGNATURE_JPEG: sResult = QString("Jpeg"); break;
        case SIGNATURE_UNKNOWN: break;
    }

    return sResult;
}

QString XSignatureSniffer::signatureToDescription(SIGNATURE signature)
{
    QString sResult = tr("Unknown binary format");

    qint32 nNumberOfRecords = sizeof(_TABLE_XSIGNATURESNIFFER_SIGNATURES) / sizeof(SIGNATURE_RECORD);

    for (qint32 i = 0; i < nNumberOfRecords; i++) {
        if (_TABLE_XSIGNATURESNIFFER_SIGNATURES[i].signature == signature) {
            sResult = QString(_TABLE_XSIGNATURESNIFFER_SIGNATURES[i].pszDescription);
            break;
        }
    }

    return sResult;
}

bool XSignatureSniffer::isZlibStream(const QByteArray &baData)
{
    bool bResult = false;

    if (baData.size() >= 6) {
        quint16 nHeader = ((quint16)(quint8)baData.at(0) << 8) | (quint8)baData.at(1);
        // 0x7801 = no/low compression
        // 0x789C = default compression
        // 0x78DA = best compression
        if ((nHeader == 0x7801) || (nHeader == 0x789C) || (nHeader == 0x78DA)) {
            bResult = true;
        }
    }

    return bResult;
}

bool XSignatureSniffer::isGzipStream(const QByteArray &baData)
{
    return isPrefixPresent(baData, "\x1F\x8B", 2);
}
