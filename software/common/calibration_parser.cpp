/*
 *  calibration_parser.cpp - Parser of the ASQE flash calibration file
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

#include "calibration_parser.h"
#include "asqe_log.h"

#include <QTextCodec>

// --------------------------------------
//     CalibrationParser implementation
// --------------------------------------
CalibrationParser::CalibrationParser(const TCalibrationLayout& layout)
    : m_layout(layout), m_lastErrorType(ERR_NONE)
{
}

bool CalibrationParser::fail(const QString& message)
{
    m_lastErrorType = ERR_CALIBRATION_FORMAT;
    m_lastErrorStr = message;
    qCWarning(lcAsqeCalibration) << message;
    return false;
}

static bool isLineBreak(QChar ch)
{
    switch (ch.unicode())
    {
    case 0x000A:    // line feed
    case 0x000B:    // line tabulation
    case 0x000C:    // form feed
    case 0x000D:    // carriage return
    case 0x001C:    // file separator
    case 0x001D:    // group separator
    case 0x001E:    // record separator
    case 0x0085:    // next line
    case 0x2028:    // line separator
    case 0x2029:    // paragraph separator
        return true;
    }
    return false;
}

QStringList CalibrationParser::splitLines(const QString& text)
{
    QStringList lines;
    int start = 0;
    int pos = 0;
    const int len = text.size();

    while (pos < len)
    {
        QChar ch = text.at(pos);
        if (isLineBreak(ch))
        {
            lines.append(text.mid(start, pos - start));
            if (ch == '\r' && pos + 1 < len && text.at(pos + 1) == '\n')
                ++pos;
            start = pos + 1;
        }
        ++pos;
    }
    if (start < len)
        lines.append(text.mid(start));

    return lines;
}

bool CalibrationParser::parseRange(const QStringList& lines, int begin, int end,
                                   const char* name, TDoubleVec& values)
{
    values.clear();
    values.reserve(end - begin);

    for (int i = begin; i < end; i++)
    {
        bool ok = false;
        double value = lines.at(i).trimmed().toDouble(&ok);
        if (!ok)
            return fail(QString("Invalid %1 value '%2' at line %3")
                            .arg(name).arg(lines.at(i).left(32)).arg(i));
        values.append(value);
    }

    return true;
}

bool CalibrationParser::parse(const QByteArray& blob, TCalibrationData& data)
{
    m_lastErrorType = ERR_NONE;
    m_lastErrorStr.clear();

    QTextCodec* codec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state(QTextCodec::ConvertInvalidToNull);
    QString text = codec->toUnicode(blob.constData(), blob.size(), &state);
    if (state.invalidChars > 0 || state.remainingChars > 0)
        return fail(QString("Calibration data is not valid UTF-8 text"));

    QStringList lines = splitLines(text);
    if (lines.size() < m_layout.minLines)
        return fail(QString("Calibration data has %1 lines, at least %2 expected")
                        .arg(lines.size()).arg(m_layout.minLines));

    TCalibrationData result;

    bool ok = false;
    result.bckAT = lines.at(m_layout.bckATLine).trimmed().toDouble(&ok);
    if (!ok)
        return fail(QString("Failed to parse bck_aT from calibration data"));

    if (!parseRange(lines, m_layout.wavelengthBegin, m_layout.wavelengthEnd,
                    "wavelength", result.wavelength)
        || !parseRange(lines, m_layout.normBegin, m_layout.normEnd,
                       "normalisation", result.normCoef)
        || !parseRange(lines, m_layout.powerBegin, m_layout.powerEnd,
                       "power", result.powerCoef))
        return false;

    qCDebug(lcAsqeCalibration) << "Parsed calibration, bck_aT =" << result.bckAT
                               << "pixels =" << result.wavelength.size();
    data = result;
    return true;
}
