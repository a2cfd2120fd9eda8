/*
 *  calibration_parser.h - Parser of the ASQE flash calibration file
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

#ifndef ASQE_CALIBRATION_PARSER_H
#define ASQE_CALIBRATION_PARSER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "asqe_types.h"

//
// Decodes the calibration blob read from flash.
//
// The blob is UTF-8 text, one value per line. Values are taken from fixed
// line positions given by TCalibrationLayout:
//   - bck_aT scalar
//   - wavelength per active pixel
//   - normalisation coefficient per active pixel
//   - power coefficient per active pixel
// Lines outside of these positions (headers, separators) are ignored.
//
class CalibrationParser
{
public:
    CalibrationParser(const TCalibrationLayout& layout = ASQE_CALIBRATION_LAYOUT_V1);

    bool parse(const QByteArray& blob, TCalibrationData& data);

    // Splits text into lines. Breaks on \n, \r\n, \r, \v, \f, \x1c-\x1e,
    // U+0085, U+2028 and U+2029; a trailing line break does not produce
    // an extra empty line.
    static QStringList splitLines(const QString& text);

    QString&   getLastError()     { return m_lastErrorStr; }
    TErrorType getLastErrorType() { return m_lastErrorType; }

private:
    bool fail(const QString& message);
    bool parseRange(const QStringList& lines, int begin, int end,
                    const char* name, TDoubleVec& values);

    // members
    TCalibrationLayout m_layout;
    QString            m_lastErrorStr;
    TErrorType         m_lastErrorType;
};

#endif // ASQE_CALIBRATION_PARSER_H
