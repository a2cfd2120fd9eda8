/*
 *  spectral_processor.cpp - Spectral corrections of ASQE spectrometer frames
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

#include "spectral_processor.h"

static double meanOf(const TRawFrame& frame, int begin, int end)
{
    double sum = 0.0;
    for (int i = begin; i < end; i++)
        sum += frame.at(i);
    return sum / (end - begin);
}

// --------------------------------------
//   SpectralProcessor implementation
// --------------------------------------
double SpectralProcessor::background(const TRawFrame& frame)
{
    double devd  = meanOf(frame, ASQE_DARK_LEAD_BEGIN, ASQE_DARK_LEAD_END);
    double devd2 = meanOf(frame, ASQE_DARK_TRAIL_BEGIN, ASQE_DARK_TRAIL_END);
    return (devd + devd2) / 2;
}

bool SpectralProcessor::subtractBackground(const TRawFrame& frame, TDoubleVec& corrected)
{
    if (frame.size() != ASQE_FRAME_PIXELS)
        return false;

    double bg = background(frame);

    corrected.resize(ASQE_SPECTRUM_PIXELS);
    for (int i = 0; i < ASQE_SPECTRUM_PIXELS; i++)
        corrected[i] = frame.at(ASQE_ACTIVE_BEGIN + i) - bg;

    return true;
}

bool SpectralProcessor::normalize(const TDoubleVec& corrected, const TCalibrationData& calibration,
                                  TDoubleVec& normalized)
{
    if (corrected.size() != ASQE_SPECTRUM_PIXELS
        || calibration.normCoef.size() != ASQE_SPECTRUM_PIXELS)
        return false;

    normalized.resize(ASQE_SPECTRUM_PIXELS);
    for (int i = 0; i < ASQE_SPECTRUM_PIXELS; i++)
        normalized[i] = corrected.at(i) / calibration.normCoef.at(i);

    return true;
}

bool SpectralProcessor::powerCalibrate(const TDoubleVec& normalized, const TCalibrationData& calibration,
                                       uint32 exposureTimeUs, TDoubleVec& calibrated)
{
    if (normalized.size() != ASQE_SPECTRUM_PIXELS
        || calibration.powerCoef.size() != ASQE_SPECTRUM_PIXELS)
        return false;

    // coefficient is divided first, as the device calibration model does
    double divisor = exposureTimeUs * calibration.bckAT;

    calibrated.resize(ASQE_SPECTRUM_PIXELS);
    for (int i = 0; i < ASQE_SPECTRUM_PIXELS; i++)
        calibrated[i] = normalized.at(i) * (calibration.powerCoef.at(i) / divisor);

    return true;
}
