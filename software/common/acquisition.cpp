/*
 *  acquisition.cpp - Acquisition control of ASQE spectrometers
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

#include "acquisition.h"
#include "asqe_log.h"

#include <QElapsedTimer>
#include <QThread>

// --------------------------------------
//   AcquisitionController implementation
// --------------------------------------
AcquisitionController::AcquisitionController(SpectrDriver& driver)
    : m_driver(driver), m_cancelRequested(0), m_reportedPixelCount(0),
      m_lastPollCount(0), m_lastErrorType(ERR_NONE)
{
}

AcquisitionController::~AcquisitionController()
{
}

bool AcquisitionController::fail(TErrorType type, const QString& message)
{
    m_lastErrorType = type;
    m_lastErrorStr = message;
    qCWarning(lcAsqeAcquisition) << message;
    return false;
}

bool AcquisitionController::configure(const TAcquisitionConfig& config)
{
    m_lastErrorType = ERR_NONE;
    m_lastErrorStr.clear();

    if (config.pixelStart >= config.pixelEnd)
        return fail(ERR_INVALID_PARAMETER,
                    QString("Invalid pixel window %1..%2")
                        .arg(config.pixelStart).arg(config.pixelEnd));

    int status = m_driver.setAcquisitionParameters(config.scans, config.blankScans,
                                                   config.scanMode, config.exposureTimeUs);
    if (status != SpectrDriver::STATUS_OK)
        return fail(ERR_DEVICE,
                    QString("setAcquisitionParameters failed with code %1").arg(status));

    uint16 numPixels = 0;
    status = m_driver.setFrameFormat(config.pixelStart, config.pixelEnd,
                                     config.reductionMode, &numPixels);
    if (status != SpectrDriver::STATUS_OK)
        return fail(ERR_DEVICE,
                    QString("setFrameFormat failed with code %1").arg(status));

    m_reportedPixelCount = numPixels;

    qCDebug(lcAsqeAcquisition) << "Configured scans" << config.scans
                               << "blank" << config.blankScans
                               << "exposure" << config.exposureTimeUs << "us"
                               << "mode" << int(config.scanMode)
                               << "pixels" << config.pixelStart << ".." << config.pixelEnd
                               << "reported" << numPixels;
    return true;
}

bool AcquisitionController::waitForFrame(int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    uint8  statusFlags = 0;
    uint16 framesInMemory = 0;

    while (framesInMemory == 0)
    {
        if (m_cancelRequested.loadAcquire())
            return fail(ERR_CANCELLED, QString("Capture cancelled"));

        QThread::msleep(ASQE_POLL_INTERVAL_MS);

        int status = m_driver.getStatus(&statusFlags, &framesInMemory);
        m_lastPollCount++;
        if (status != SpectrDriver::STATUS_OK)
            return fail(ERR_DEVICE, QString("getStatus failed with code %1").arg(status));

        if (framesInMemory == 0 && timeoutMs >= 0 && timer.elapsed() >= timeoutMs)
            return fail(ERR_TIMEOUT,
                        QString("No frame after %1 ms").arg(timer.elapsed()));
    }

    return true;
}

bool AcquisitionController::captureFrame(TRawFrame& frame, int timeoutMs)
{
    m_lastErrorType = ERR_NONE;
    m_lastErrorStr.clear();
    m_lastPollCount = 0;
    m_cancelRequested.storeRelease(0);

    int status = m_driver.triggerAcquisition();
    if (status != SpectrDriver::STATUS_OK)
        return fail(ERR_DEVICE, QString("triggerAcquisition failed with code %1").arg(status));

    if (!waitForFrame(timeoutMs))
        return false;

    TRawFrame buffer(ASQE_FRAME_PIXELS, 0);
    status = m_driver.getFrame(buffer.data(), ASQE_FRAME_PIXELS);
    if (status != SpectrDriver::STATUS_OK)
        return fail(ERR_DEVICE, QString("getFrame failed with code %1").arg(status));

    qCDebug(lcAsqeAcquisition) << "Captured frame after" << m_lastPollCount << "polls";
    frame = buffer;
    return true;
}
