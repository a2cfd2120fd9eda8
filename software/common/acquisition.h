/*
 *  acquisition.h - Acquisition control of ASQE spectrometers
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

#ifndef ASQE_ACQUISITION_H
#define ASQE_ACQUISITION_H

#include <QAtomicInt>
#include <QString>

#include "asqe_types.h"
#include "spectr_driver.h"

//
// Pushes acquisition parameters to the device and captures frames.
//
// Capture triggers the device, then polls its status every
// ASQE_POLL_INTERVAL_MS until a frame is in memory and reads it. Only one
// operation may be in flight per driver; the class does no locking. The
// only member safe to call from another thread is cancelCapture().
//
class AcquisitionController
{
public:
    AcquisitionController(SpectrDriver& driver);
    ~AcquisitionController();

    bool configure(const TAcquisitionConfig& config);

    // Captures one frame of ASQE_FRAME_PIXELS samples. Waits up to
    // timeoutMs for the frame, negative timeout waits forever.
    bool captureFrame(TRawFrame& frame, int timeoutMs = -1);

    // makes a running captureFrame() fail with ERR_CANCELLED
    void cancelCapture() { m_cancelRequested.storeRelease(1); }

    // pixel count reported by the device for the last frame format
    uint16     getReportedPixelCount() { return m_reportedPixelCount; }
    int        getLastPollCount()      { return m_lastPollCount; }
    QString&   getLastError()          { return m_lastErrorStr; }
    TErrorType getLastErrorType()      { return m_lastErrorType; }

private:
    bool fail(TErrorType type, const QString& message);
    bool waitForFrame(int timeoutMs);

    // members
    SpectrDriver&  m_driver;
    QAtomicInt     m_cancelRequested;
    uint16         m_reportedPixelCount;
    int            m_lastPollCount;
    QString        m_lastErrorStr;
    TErrorType     m_lastErrorType;
};

#endif // ASQE_ACQUISITION_H
