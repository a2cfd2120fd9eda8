/*
 *  flash_reader.cpp - Reads the calibration blob from ASQE spectrometer flash
 *
 *  Copyright 2017-2019 Alexey Danilchenko
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3, or (at your option)
 *  any later version with ADDITION (see below).
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.

 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, 51 Franklin Street - Fifth Floor, Boston,
 *  MA 02110-1301, USA.
 */

#include "flash_reader.h"
#include "asqe_log.h"

#include <limits.h>

static const char c_terminationMarker[] = { '\xFF', '\xFF' };

// --------------------------------------
//     FlashReader implementation
// --------------------------------------
FlashReader::FlashReader(SpectrDriver& driver)
    : m_driver(driver), m_markerPolicy(MARKER_TRUNCATE_AT_CAP),
      m_markerFound(false), m_lastErrorType(ERR_NONE)
{
}

FlashReader::~FlashReader()
{
}

bool FlashReader::fail(TErrorType type, const QString& message)
{
    m_lastErrorType = type;
    m_lastErrorStr = message;
    qCWarning(lcAsqeFlash) << message;
    return false;
}

bool FlashReader::readFlash(uint32 offset, uint32 size, QByteArray& data)
{
    m_lastErrorType = ERR_NONE;
    m_lastErrorStr.clear();

    if (size > uint32(INT_MAX))
    {
        data.clear();
        return fail(ERR_INVALID_PARAMETER,
                    QString("Flash read size %1 exceeds buffer limit").arg(size));
    }

    data.fill(0, int(size));
    int status = m_driver.readFlash(reinterpret_cast<uint8*>(data.data()), offset, size);
    if (status != SpectrDriver::STATUS_OK)
    {
        data.clear();
        return fail(ERR_DEVICE,
                    QString("readFlash failed at offset %1 with code %2").arg(offset).arg(status));
    }

    return true;
}

bool FlashReader::readCalibrationBlob(QByteArray& blob)
{
    const QByteArray marker(c_terminationMarker, sizeof(c_terminationMarker));

    uint32 offset = 0;
    QByteArray chunk;

    blob.clear();
    m_markerFound = false;

    while (offset <= ASQE_FLASH_MAX_OFFSET && !m_markerFound)
    {
        if (!readFlash(offset, ASQE_FLASH_CHUNK_SIZE, chunk))
        {
            blob.clear();
            return false;
        }

        int stopIdx = chunk.indexOf(marker);
        if (stopIdx != -1)
        {
            blob.append(chunk.left(stopIdx));
            m_markerFound = true;
        }
        else
            blob.append(chunk);

        offset += ASQE_FLASH_CHUNK_SIZE;
    }

    if (!m_markerFound)
    {
        if (m_markerPolicy == MARKER_REQUIRED)
        {
            blob.clear();
            return fail(ERR_CALIBRATION_FORMAT,
                        QString("Calibration termination marker not found within %1 bytes")
                            .arg(offset));
        }
        qCWarning(lcAsqeFlash) << "Calibration termination marker not found, using"
                               << blob.size() << "bytes read";
    }
    else
        qCDebug(lcAsqeFlash) << "Read calibration blob of" << blob.size() << "bytes";

    return true;
}
