/*
 *  asqe_types.h - Common types and constants of the host side API for
 *                 ASQE line-scan fiber spectrometers
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

#ifndef ASQE_TYPES_H
#define ASQE_TYPES_H

#include <QVector>
#include <QString>

// typdefs for easier handling of sized structures
typedef unsigned char      byte;
typedef unsigned char      uint8;
typedef short              int16;
typedef unsigned short     uint16;
typedef int                int32;
typedef unsigned int       uint32;

typedef QVector<double> TDoubleVec;
typedef QVector<uint16> TRawFrame;

// --------------------------------------
//     Sensor frame layout
// --------------------------------------

// total samples returned by the device for one frame
const int ASQE_FRAME_PIXELS      = 3694;

// leading dark pixels used for background, half open [15, 31)
const int ASQE_DARK_LEAD_BEGIN   = 15;
const int ASQE_DARK_LEAD_END     = 31;

// trailing dark pixels used for background, half open [3686, 3692)
const int ASQE_DARK_TRAIL_BEGIN  = 3686;
const int ASQE_DARK_TRAIL_END    = 3692;

// active pixel window, half open [32, 3685)
const int ASQE_ACTIVE_BEGIN      = 32;
const int ASQE_ACTIVE_END        = 3685;
const int ASQE_SPECTRUM_PIXELS   = ASQE_ACTIVE_END - ASQE_ACTIVE_BEGIN;

// device poll cadence while waiting for a frame
const int ASQE_POLL_INTERVAL_MS  = 25;

// --------------------------------------
//     Flash calibration layout
// --------------------------------------

// Calibration file layout stored in device flash (version 1). Line
// indices are 0 based, ranges are half open. Every coefficient range
// spans exactly ASQE_SPECTRUM_PIXELS lines.
struct TCalibrationLayout
{
    int bckATLine;
    int wavelengthBegin;
    int wavelengthEnd;
    int normBegin;
    int normEnd;
    int powerBegin;
    int powerEnd;
    int minLines;
};

const TCalibrationLayout ASQE_CALIBRATION_LAYOUT_V1 =
{
    1,              // bck_aT
    12,    3665,    // wavelength
    3666,  7319,    // normalisation coefficients
    7320,  10973,   // power coefficients
    10973           // lines required
};

const uint32 ASQE_FLASH_CHUNK_SIZE = 1000;
const uint32 ASQE_FLASH_MAX_OFFSET = 100000;

// --------------------------------------
//     Data model
// --------------------------------------

enum TErrorType {
    ERR_NONE               = 0,
    ERR_CONNECTION         = 1,  // device rejected connection or is not connected
    ERR_DEVICE             = 2,  // non zero status from a device primitive
    ERR_CALIBRATION_FORMAT = 3,  // flash calibration blob is malformed
    ERR_TIMEOUT            = 4,  // frame did not arrive within the capture timeout
    ERR_CANCELLED          = 5,  // capture cancelled by the caller
    ERR_INVALID_PARAMETER  = 6   // rejected locally before reaching the device
};

enum TMarkerPolicy {
    MARKER_TRUNCATE_AT_CAP = 0,  // stop at the offset cap and keep what was read
    MARKER_REQUIRED        = 1   // missing termination marker is a format error
};

struct TAcquisitionConfig
{
    uint16 scans;
    uint16 blankScans;
    uint32 exposureTimeUs;
    uint8  scanMode;
    uint16 pixelStart;
    uint16 pixelEnd;
    uint8  reductionMode;

    TAcquisitionConfig()
        : scans(1), blankScans(0), exposureTimeUs(1000), scanMode(3),
          pixelStart(0), pixelEnd(3647), reductionMode(0) {}

    bool operator==(const TAcquisitionConfig& rhs) const
    {
        return scans == rhs.scans && blankScans == rhs.blankScans
            && exposureTimeUs == rhs.exposureTimeUs && scanMode == rhs.scanMode
            && pixelStart == rhs.pixelStart && pixelEnd == rhs.pixelEnd
            && reductionMode == rhs.reductionMode;
    }
    bool operator!=(const TAcquisitionConfig& rhs) const { return !(*this == rhs); }
};

struct TCalibrationData
{
    double     bckAT;
    TDoubleVec wavelength;
    TDoubleVec normCoef;
    TDoubleVec powerCoef;

    TCalibrationData() : bckAT(0.0) {}
};

struct TCorrectedSpectrum
{
    TDoubleVec wavelength;
    TDoubleVec intensity;
};

QString errorTypeName(TErrorType type);

#endif // ASQE_TYPES_H
