/*
 *  asqe_api.h - Implementation of API calls to ASQE line-scan fiber
 *              spectrometers
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

#ifndef ASQE_API_H
#define ASQE_API_H

#include <QScopedPointer>
#include <QString>

#include "asqe_types.h"
#include "spectr_driver.h"
#include "flash_reader.h"
#include "calibration_parser.h"
#include "acquisition.h"

//
// Class that provides access to an ASQE spectrometer through the native
// driver.
//
// The session owns the acquisition configuration and the calibration read
// from device flash. Calibration is loaded on first use and kept for the
// lifetime of the object, flash is never re-read. Every measurement call
// triggers exactly one acquisition. The device is disconnected when the
// object is destroyed.
//
class AsqeDevice
{
public:
    enum TState {
        STATE_DISCONNECTED = 0,
        STATE_CONNECTED    = 1,
        STATE_CONFIGURING  = 2,
        STATE_CAPTURING    = 3
    };

    // default time to wait for a frame
    static const int DEFAULT_CAPTURE_TIMEOUT_MS = 10000;

    // constructors/destructors
    AsqeDevice(SpectrDriver& driver);
    ~AsqeDevice();

    // connection, empty serial connects to the first device found
    bool connect(const QString& serial = QString());
    void disconnect();

    // pushes acquisition parameters to the device, config() changes
    // only when the device accepted them
    bool configure(const TAcquisitionConfig& config);
    bool configure();

    // measurements
    bool captureRaw(TRawFrame& frame);
    bool getBackgroundCorrected(TDoubleVec& corrected);
    bool getNormalized(TCorrectedSpectrum& spectrum);
    bool getCalibrated(TCorrectedSpectrum& spectrum);

    // aborts a running capture, may be called from another thread
    void cancelCapture() { m_acquisition.cancelCapture(); }

    // reads and parses flash calibration unless already loaded
    bool ensureCalibrationLoaded();

    // wavelength of every active pixel, loads calibration if needed
    bool getWavelengths(TDoubleVec& wavelengths);

    // setters
    void setCaptureTimeout(int timeoutMs)        { m_captureTimeoutMs = timeoutMs; }
    void setMarkerPolicy(TMarkerPolicy policy)   { m_flash.setMarkerPolicy(policy); }

    // getters
    bool                      isConnected()           { return m_state != STATE_DISCONNECTED; }
    TState                    getState()              { return m_state; }
    const TAcquisitionConfig& config()                { return m_config; }
    int                       getCaptureTimeout()     { return m_captureTimeoutMs; }
    TMarkerPolicy             getMarkerPolicy()       { return m_flash.getMarkerPolicy(); }
    uint16                    getReportedPixelCount() { return m_acquisition.getReportedPixelCount(); }
    bool                      calibrationMarkerFound(){ return m_flash.markerFound(); }
    QString&                  getLastError()          { return m_lastErrorStr; }
    TErrorType                getLastErrorType()      { return m_lastErrorType; }

    // calibration, null until loaded
    const TCalibrationData*   calibration()           { return m_calibration.data(); }

private:
    // private functions
    bool fail(TErrorType type, const QString& message);
    bool checkConnected();
    bool capture(TRawFrame& frame);
    bool backgroundCorrected(TDoubleVec& corrected);
    bool normalized(TDoubleVec& normalized);

    // members
    SpectrDriver&                    m_driver;
    FlashReader                      m_flash;
    CalibrationParser                m_parser;
    AcquisitionController            m_acquisition;
    TAcquisitionConfig               m_config;
    QScopedPointer<TCalibrationData> m_calibration;
    TState                           m_state;
    int                              m_captureTimeoutMs;
    QString                          m_lastErrorStr;
    TErrorType                       m_lastErrorType;
};

#endif // ASQE_API_H
