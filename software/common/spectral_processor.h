/*
 *  spectral_processor.h - Spectral corrections of ASQE spectrometer frames
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

#ifndef ASQE_SPECTRAL_PROCESSOR_H
#define ASQE_SPECTRAL_PROCESSOR_H

#include "asqe_types.h"

//
// Numeric correction pipeline applied to captured frames:
//
//   raw frame -> background corrected -> normalised -> power calibrated
//
// All stages are pure. They fail only when input lengths do not match
// the frame layout. Zero coefficients are not special cased, results
// follow IEEE division (inf or NaN).
//
class SpectralProcessor
{
public:
    // Background level, the mean of the averages of the leading
    // [15, 31) and trailing [3686, 3692) dark pixels
    static double background(const TRawFrame& frame);

    // Active pixels [32, 3685) minus background
    static bool subtractBackground(const TRawFrame& frame, TDoubleVec& corrected);

    // corrected[i] / normCoef[i]
    static bool normalize(const TDoubleVec& corrected, const TCalibrationData& calibration,
                          TDoubleVec& normalized);

    // normalized[i] * powerCoef[i] / (exposureTimeUs * bck_aT)
    static bool powerCalibrate(const TDoubleVec& normalized, const TCalibrationData& calibration,
                               uint32 exposureTimeUs, TDoubleVec& calibrated);
};

#endif // ASQE_SPECTRAL_PROCESSOR_H
