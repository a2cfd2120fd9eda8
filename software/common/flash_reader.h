/*
 *  flash_reader.h - Reads the calibration blob from ASQE spectrometer flash
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

#ifndef ASQE_FLASH_READER_H
#define ASQE_FLASH_READER_H

#include <QByteArray>
#include <QString>

#include "asqe_types.h"
#include "spectr_driver.h"

//
// Reads device flash memory.
//
// The calibration blob starts at offset 0 and ends right before the first
// 0xFF 0xFF marker. Flash is read in ASQE_FLASH_CHUNK_SIZE chunks and every
// chunk is scanned for the marker on its own, so a marker split between two
// chunks is not recognised. When no marker is found reading stops after the
// chunk at ASQE_FLASH_MAX_OFFSET and the outcome depends on the marker
// policy.
//
class FlashReader
{
public:
    FlashReader(SpectrDriver& driver);
    ~FlashReader();

    // reads size bytes from the given offset
    bool readFlash(uint32 offset, uint32 size, QByteArray& data);

    // reads the whole calibration blob (without the marker)
    bool readCalibrationBlob(QByteArray& blob);

    void setMarkerPolicy(TMarkerPolicy policy) { m_markerPolicy = policy; }

    TMarkerPolicy getMarkerPolicy()  { return m_markerPolicy; }
    bool          markerFound()      { return m_markerFound; }
    QString&      getLastError()     { return m_lastErrorStr; }
    TErrorType    getLastErrorType() { return m_lastErrorType; }

private:
    bool fail(TErrorType type, const QString& message);

    // members
    SpectrDriver&  m_driver;
    TMarkerPolicy  m_markerPolicy;
    bool           m_markerFound;
    QString        m_lastErrorStr;
    TErrorType     m_lastErrorType;
};

#endif // ASQE_FLASH_READER_H
