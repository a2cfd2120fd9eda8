/*
 *  test_calibration_parser.cpp - CalibrationParser tests
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

#include <gtest/gtest.h>

#include "qt_printers.h"

#include <QList>

#include "calibration_parser.h"
#include "calibration_blob.h"

static void expectSameCalibration(const TCalibrationData& expected, const TCalibrationData& actual)
{
    EXPECT_EQ(expected.bckAT, actual.bckAT);
    ASSERT_EQ(ASQE_SPECTRUM_PIXELS, actual.wavelength.size());
    ASSERT_EQ(ASQE_SPECTRUM_PIXELS, actual.normCoef.size());
    ASSERT_EQ(ASQE_SPECTRUM_PIXELS, actual.powerCoef.size());
    EXPECT_TRUE(expected.wavelength == actual.wavelength);
    EXPECT_TRUE(expected.normCoef == actual.normCoef);
    EXPECT_TRUE(expected.powerCoef == actual.powerCoef);
}

// replaces the content of a 0 based line of calibration text
static QByteArray replaceLine(const QByteArray& text, int lineIdx, const QByteArray& value)
{
    QList<QByteArray> lines = text.split('\n');
    lines[lineIdx] = value;
    QByteArray result;
    for (int i = 0; i < lines.size(); i++)
    {
        if (i)
            result.append('\n');
        result.append(lines.at(i));
    }
    return result;
}

TEST(CalibrationParser, SplitLines)
{
    EXPECT_EQ(QStringList() << "a" << "b", CalibrationParser::splitLines("a\nb\n"));
    EXPECT_EQ(QStringList() << "a" << "b", CalibrationParser::splitLines("a\nb"));
    EXPECT_EQ(QStringList() << "a" << "" << "b", CalibrationParser::splitLines("a\n\nb"));
    EXPECT_EQ(QStringList() << "a" << "b" << "c", CalibrationParser::splitLines("a\r\nb\rc"));
    EXPECT_EQ(QStringList() << "" << "a", CalibrationParser::splitLines("\na"));
    EXPECT_TRUE(CalibrationParser::splitLines("").isEmpty());
}

TEST(CalibrationParser, SplitLinesOnUnicodeBreaks)
{
    EXPECT_EQ(QStringList() << "a" << "b" << "c", CalibrationParser::splitLines("a\vb\fc"));
    EXPECT_EQ(QStringList() << "a" << "b" << "c" << "d",
              CalibrationParser::splitLines("a\x1c" "b\x1d" "c\x1e" "d"));

    QString text = QString("a") + QChar(0x0085) + "b" + QChar(0x2028) + "c"
                 + QChar(0x2029) + "d" + QChar(0x2029);
    EXPECT_EQ(QStringList() << "a" << "b" << "c" << "d", CalibrationParser::splitLines(text));

    // tab and other control characters stay inside the line
    EXPECT_EQ(QStringList() << "a\tb\x1f" "c", CalibrationParser::splitLines("a\tb\x1f" "c"));
}

TEST(CalibrationParser, FormFeedInHeaderShiftsLayout)
{
    // an extra break in a header line moves every following value down
    // by one line, so the first wavelength line hits a header
    QByteArray text = replaceLine(calibrationText(makeCalibration()), 3, "header\fcontinued");
    CalibrationParser parser;

    TCalibrationData actual;
    EXPECT_FALSE(parser.parse(text, actual));
    EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
    EXPECT_TRUE(parser.getLastError().contains("wavelength"));
}

TEST(CalibrationParser, ParsesSyntheticBlobExactly)
{
    TCalibrationData expected = makeCalibration(0.8125);
    CalibrationParser parser;

    TCalibrationData actual;
    ASSERT_TRUE(parser.parse(calibrationText(expected), actual)) << qPrintable(parser.getLastError());
    EXPECT_EQ(ERR_NONE, parser.getLastErrorType());
    expectSameCalibration(expected, actual);
}

TEST(CalibrationParser, RoundTripsNonTrivialValues)
{
    TCalibrationData expected = makeCalibration(1.0 / 3.0);
    for (int i = 0; i < ASQE_SPECTRUM_PIXELS; i++)
    {
        expected.wavelength[i] = 340.0 + i / 7.0;
        expected.normCoef[i] = 1.0e-5 * (i + 1) / 11.0;
        expected.powerCoef[i] = -2.5e7 / (i + 3);
    }
    CalibrationParser parser;

    TCalibrationData actual;
    ASSERT_TRUE(parser.parse(calibrationText(expected), actual));
    expectSameCalibration(expected, actual);
}

TEST(CalibrationParser, AcceptsCrLfLineEndings)
{
    TCalibrationData expected = makeCalibration();
    CalibrationParser parser;

    TCalibrationData actual;
    ASSERT_TRUE(parser.parse(calibrationText(expected, "\r\n"), actual));
    expectSameCalibration(expected, actual);
}

TEST(CalibrationParser, IgnoresLinesAfterLayout)
{
    TCalibrationData expected = makeCalibration();
    QByteArray text = calibrationText(expected);
    text.append("checksum abc\nmore text\n");
    CalibrationParser parser;

    TCalibrationData actual;
    ASSERT_TRUE(parser.parse(text, actual));
    expectSameCalibration(expected, actual);
}

TEST(CalibrationParser, AcceptsSurroundingWhitespace)
{
    TCalibrationData expected = makeCalibration(2.0);
    QByteArray text = replaceLine(calibrationText(expected), 1, "  2.0\t");
    CalibrationParser parser;

    TCalibrationData actual;
    ASSERT_TRUE(parser.parse(text, actual));
    EXPECT_EQ(2.0, actual.bckAT);
}

TEST(CalibrationParser, TooFewLinesIsFormatError)
{
    QByteArray text = calibrationText(makeCalibration());
    int cut = text.lastIndexOf('\n', text.size() - 2);
    text.truncate(cut + 1);
    CalibrationParser parser;

    TCalibrationData actual;
    EXPECT_FALSE(parser.parse(text, actual));
    EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
    EXPECT_TRUE(parser.getLastError().contains("10972"));
}

TEST(CalibrationParser, EmptyBlobIsFormatError)
{
    CalibrationParser parser;

    TCalibrationData actual;
    EXPECT_FALSE(parser.parse(QByteArray(), actual));
    EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
}

TEST(CalibrationParser, InvalidBckATIsFormatError)
{
    QByteArray text = replaceLine(calibrationText(makeCalibration()), 1, "n/a");
    CalibrationParser parser;

    TCalibrationData actual;
    EXPECT_FALSE(parser.parse(text, actual));
    EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
    EXPECT_TRUE(parser.getLastError().contains("bck_aT"));
}

TEST(CalibrationParser, NonNumericCoefficientIsFormatError)
{
    const TCalibrationLayout& layout = ASQE_CALIBRATION_LAYOUT_V1;
    const int badLines[] = { layout.wavelengthBegin, layout.normBegin + 100, layout.powerEnd - 1 };

    for (unsigned i = 0; i < sizeof(badLines)/sizeof(badLines[0]); i++)
    {
        QByteArray text = replaceLine(calibrationText(makeCalibration()), badLines[i], "1.2.3");
        CalibrationParser parser;

        TCalibrationData actual;
        EXPECT_FALSE(parser.parse(text, actual)) << "line " << badLines[i];
        EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
        EXPECT_TRUE(parser.getLastError().contains(QString::number(badLines[i])));
    }
}

TEST(CalibrationParser, EmptyCoefficientLineIsFormatError)
{
    QByteArray text = replaceLine(calibrationText(makeCalibration()), 5000, "");
    CalibrationParser parser;

    TCalibrationData actual;
    EXPECT_FALSE(parser.parse(text, actual));
    EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
}

TEST(CalibrationParser, InvalidUtf8IsFormatError)
{
    QByteArray text = calibrationText(makeCalibration());
    text[3] = '\xC3';
    text[4] = '\x28';
    CalibrationParser parser;

    TCalibrationData actual;
    EXPECT_FALSE(parser.parse(text, actual));
    EXPECT_EQ(ERR_CALIBRATION_FORMAT, parser.getLastErrorType());
    EXPECT_TRUE(parser.getLastError().contains("UTF-8"));
}

TEST(CalibrationParser, FailedParseLeavesOutputUntouched)
{
    TCalibrationData previous = makeUniformCalibration(5.0, 1.0, 1.0);
    TCalibrationData data = previous;
    QByteArray text = replaceLine(calibrationText(makeCalibration()), 7000, "x");
    CalibrationParser parser;

    EXPECT_FALSE(parser.parse(text, data));
    EXPECT_EQ(5.0, data.bckAT);
    EXPECT_TRUE(previous.normCoef == data.normCoef);
}
