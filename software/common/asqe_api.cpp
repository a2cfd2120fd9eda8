/*
 *  asqe_api.cpp - Implementation of API calls to ASQE line-scan fiber
 *                spectrometers
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


#include "asqe_api.h"
#include "asqe_log.h"
#include "spectral_processor.h"

#include <QByteArray>

// --------------------------------------
//     ASQE Device implementation
// --------------------------------------

const int AsqeDevice::DEFAULT_CAPTURE_TIMEOUT_MS;

// constructors/destructors
AsqeDevice::AsqeDevice(SpectrDriver& driver)
    : m_driver(driver), m_flash(driver), m_parser(), m_acquisition(driver),
      m_config(), m_state(STATE_DISCONNECTED),
      m_captureTimeoutMs(DEFAULT_CAPTURE_TIMEOUT_MS), m_lastErrorType(ERR_NONE)
{
}

AsqeDevice::~AsqeDevice()
{
    disconnect();
}

bool AsqeDevice::fail(TErrorType type, const QString& message)
{
    m_lastErrorType = type;
    m_lastErrorStr = message;
    return false;
}

bool AsqeDevice::checkConnected()
{
    m_lastErrorType = ERR_NONE;
    m_lastErrorStr.clear();

    if (!isConnected())
    {
        qCWarning(lcAsqeDevice) << "Device is not connected";
        return fail(ERR_CONNECTION, "Device is not connected");
    }
    return true;
}

bool AsqeDevice::connect(const QString& serial)
{
    m_lastErrorType = ERR_NONE;
    m_lastErrorStr.clear();

    if (isConnected())
        return true;

    QByteArray serialStr = serial.toLatin1();
    int result = m_driver.connectToDevice(serial.isEmpty() ? 0 : serialStr.constData());
    if (result != SpectrDriver::STATUS_OK)
    {
        qCWarning(lcAsqeDevice) << "Failed to connect to device, error code" << result;
        return fail(ERR_CONNECTION,
                    QString("Failed to connect to device. Error code: %1").arg(result));
    }

    qCDebug(lcAsqeDevice) << "Connected to device" << (serial.isEmpty() ? "(first found)" : serial);
    m_state = STATE_CONNECTED;
    return true;
}

void AsqeDevice::disconnect()
{
    if (!isConnected())
        return;

    m_driver.disconnectDevice();
    m_state = STATE_DISCONNECTED;
    qCDebug(lcAsqeDevice) << "Disconnected from device";
}

bool AsqeDevice::configure(const TAcquisitionConfig& config)
{
    if (!checkConnected())
        return false;

    // session keeps the last configuration the device accepted
    m_state = STATE_CONFIGURING;
    bool success = m_acquisition.configure(config);
    m_state = STATE_CONNECTED;

    if (!success)
        return fail(m_acquisition.getLastErrorType(), m_acquisition.getLastError());

    m_config = config;
    return true;
}

bool AsqeDevice::configure()
{
    TAcquisitionConfig config = m_config;
    return configure(config);
}

bool AsqeDevice::getWavelengths(TDoubleVec& wavelengths)
{
    if (!ensureCalibrationLoaded())
        return false;

    wavelengths = m_calibration->wavelength;
    return true;
}

bool AsqeDevice::ensureCalibrationLoaded()
{
    if (m_calibration)
        return true;

    if (!checkConnected())
        return false;

    QByteArray blob;
    if (!m_flash.readCalibrationBlob(blob))
        return fail(m_flash.getLastErrorType(), m_flash.getLastError());

    QScopedPointer<TCalibrationData> data(new TCalibrationData);
    if (!m_parser.parse(blob, *data))
        return fail(m_parser.getLastErrorType(), m_parser.getLastError());

    m_calibration.swap(data);
    qCDebug(lcAsqeDevice) << "Calibration loaded";
    return true;
}

bool AsqeDevice::capture(TRawFrame& frame)
{
    m_state = STATE_CAPTURING;
    bool success = m_acquisition.captureFrame(frame, m_captureTimeoutMs);
    m_state = STATE_CONNECTED;

    if (!success)
        return fail(m_acquisition.getLastErrorType(), m_acquisition.getLastError());

    return true;
}

bool AsqeDevice::backgroundCorrected(TDoubleVec& corrected)
{
    TRawFrame frame;
    if (!capture(frame))
        return false;

    if (!SpectralProcessor::subtractBackground(frame, corrected))
        return fail(ERR_DEVICE, QString("Unexpected frame length %1").arg(frame.size()));

    return true;
}

bool AsqeDevice::normalized(TDoubleVec& normalized)
{
    TDoubleVec corrected;
    if (!backgroundCorrected(corrected))
        return false;

    if (!SpectralProcessor::normalize(corrected, *m_calibration, normalized))
        return fail(ERR_CALIBRATION_FORMAT, "Normalisation coefficients do not match frame layout");

    return true;
}

bool AsqeDevice::captureRaw(TRawFrame& frame)
{
    if (!checkConnected())
        return false;

    return capture(frame);
}

bool AsqeDevice::getBackgroundCorrected(TDoubleVec& corrected)
{
    if (!checkConnected())
        return false;

    return backgroundCorrected(corrected);
}

bool AsqeDevice::getNormalized(TCorrectedSpectrum& spectrum)
{
    if (!checkConnected() || !ensureCalibrationLoaded())
        return false;

    TDoubleVec intensity;
    if (!normalized(intensity))
        return false;

    spectrum.wavelength = m_calibration->wavelength;
    spectrum.intensity = intensity;
    return true;
}

bool AsqeDevice::getCalibrated(TCorrectedSpectrum& spectrum)
{
    if (!checkConnected() || !ensureCalibrationLoaded())
        return false;

    TDoubleVec intensity;
    if (!normalized(intensity))
        return false;

    if (!SpectralProcessor::powerCalibrate(intensity, *m_calibration,
                                           m_config.exposureTimeUs, intensity))
        return fail(ERR_CALIBRATION_FORMAT, "Power coefficients do not match frame layout");

    spectrum.wavelength = m_calibration->wavelength;
    spectrum.intensity = intensity;
    return true;
}
