/*
    main.cpp - console application sample for ASQE spectrometers

    Copyright 2017-2019 Alexey Danilchenko

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 3, or (at your option)
    any later version with ADDITION (see below).

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, 51 Franklin Street - Fifth Floor, Boston,
    MA 02110-1301, USA.
*/
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QString>
#include <QTextStream>

#include <stdio.h>

#include "asqe_api.h"
#include "asqe_settings.h"
#include "spectr_driver.h"

#define APP_NAME "SpectrometerCon"
#define APP_VERSION "1.0"

// --------------------------------------------------------
//    helper functions
// --------------------------------------------------------
static int reportError(const QString& context, TErrorType type, const QString& message)
{
    QTextStream err(stderr);
    err << context << ": " << errorTypeName(type) << ": " << message << "\n";
    return 1;
}

static QString pixelsCsv(const TDoubleVec& values)
{
    QString csv = "Pixel,Value\n";
    for (int i=0; i<values.size(); i++)
        csv.append(QString("%1,%2\n").arg(i).arg(values.at(i), 0, 'g', 17));
    return csv;
}

static QString spectrumCsv(const TCorrectedSpectrum& spectrum)
{
    QString csv = "Wavelength,Measurement\n";
    for (int i=0; i<spectrum.intensity.size(); i++)
        csv.append(QString("%1,%2\n")
                       .arg(spectrum.wavelength.at(i), 0, 'g', 17)
                       .arg(spectrum.intensity.at(i), 0, 'g', 17));
    return csv;
}

// --------------------------------------------------------
//    main
// --------------------------------------------------------
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(APP_NAME);
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Captures one spectrum from an ASQE spectrometer and prints it as CSV");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt(QStringList() << "c" << "config",
                                 "Settings INI file.", "file");
    QCommandLineOption modeOpt(QStringList() << "m" << "mode",
                               "Result type: raw, background, normalized or calibrated.",
                               "mode", "calibrated");
    QCommandLineOption outputOpt(QStringList() << "o" << "output",
                                 "Write CSV to file instead of stdout.", "file");
    QCommandLineOption serialOpt(QStringList() << "s" << "serial",
                                 "Device serial number, first device when omitted.", "serial");
    parser.addOption(configOpt);
    parser.addOption(modeOpt);
    parser.addOption(outputOpt);
    parser.addOption(serialOpt);
    parser.process(app);

    AsqeSettings settings;
    if (parser.isSet(configOpt) && !settings.load(parser.value(configOpt)))
        return reportError("settings", ERR_INVALID_PARAMETER, settings.getLastError());

    QString mode = parser.value(modeOpt).toLower();
    if (mode != "raw" && mode != "background" && mode != "normalized" && mode != "calibrated")
        return reportError("mode", ERR_INVALID_PARAMETER, QString("Unknown mode %1").arg(mode));

    LibSpectrDriver driver;
    if (!driver.load(settings.getLibraryPath()))
        return reportError("driver", ERR_CONNECTION, driver.getLastError());

    QString csv;
    {
        // device disconnects when leaving this scope on every path
        AsqeDevice device(driver);
        settings.applyTo(device);

        if (!device.connect(parser.value(serialOpt))
            || !device.configure(settings.acquisition()))
            return reportError("device", device.getLastErrorType(), device.getLastError());

        bool success = false;
        if (mode == "raw")
        {
            TRawFrame frame;
            success = device.captureRaw(frame);
            TDoubleVec values;
            for (int i=0; i<frame.size(); i++)
                values.append(frame.at(i));
            csv = pixelsCsv(values);
        }
        else if (mode == "background")
        {
            TDoubleVec corrected;
            success = device.getBackgroundCorrected(corrected);
            csv = pixelsCsv(corrected);
        }
        else
        {
            TCorrectedSpectrum spectrum;
            success = mode == "normalized" ? device.getNormalized(spectrum)
                                           : device.getCalibrated(spectrum);
            csv = spectrumCsv(spectrum);
        }

        if (!success)
            return reportError("measure", device.getLastErrorType(), device.getLastError());
    }

    if (parser.isSet(outputOpt))
    {
        QFile file(parser.value(outputOpt));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
            return reportError("output", ERR_INVALID_PARAMETER, file.errorString());
        QTextStream out(&file);
        out << csv;
    }
    else
    {
        QTextStream out(stdout);
        out << csv;
    }

    return 0;
}
