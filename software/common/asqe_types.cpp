/*
 *  asqe_types.cpp - Common types of the host side API for ASQE spectrometers
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

#include "asqe_types.h"

QString errorTypeName(TErrorType type)
{
    switch (type)
    {
    case ERR_NONE:               return "NoError";
    case ERR_CONNECTION:         return "ConnectionError";
    case ERR_DEVICE:             return "DeviceError";
    case ERR_CALIBRATION_FORMAT: return "CalibrationFormatError";
    case ERR_TIMEOUT:            return "TimeoutError";
    case ERR_CANCELLED:          return "Cancelled";
    case ERR_INVALID_PARAMETER:  return "InvalidParameter";
    }
    return "UnknownError";
}
