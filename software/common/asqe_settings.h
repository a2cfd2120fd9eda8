/*
 *  asqe_settings.h - Persistent settings of ASQE spectrometer sessions
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

#ifndef ASQE_SETTINGS_H
#define ASQE_SETTINGS_H

#include <QString>

#include "asqe_types.h"

class AsqeDevice;
class QSettings;

//
// Session settings stored in an INI file:
//
//   [Acquisition]
//   scans, blankScans, exposureTimeUs, scanMode, pixelStart, pixelEnd,
//   reductionMode
//
//   [Session]
//   captureTimeoutMs  - negative waits for a frame forever
//   markerPolicy      - "truncate" or "require"
//   libraryPath       - native driver library, empty for platform default
//
// Missing or out of range values keep their defaults.
//
class AsqeSettings
{
public:
    AsqeSettings();

    bool load(const QString& fileName);
    bool save(const QString& fileName);

    // applies session options, acquisition() is pushed by AsqeDevice::configure()
    void applyTo(AsqeDevice& device);

    TAcquisitionConfig& acquisition()           { return m_acquisition; }
    int                 getCaptureTimeout()     { return m_captureTimeoutMs; }
    TMarkerPolicy       getMarkerPolicy()       { return m_markerPolicy; }
    QString&            getLibraryPath()        { return m_libraryPath; }
    QString&            getLastError()          { return m_lastErrorStr; }

    void setCaptureTimeout(int timeoutMs)       { m_captureTimeoutMs = timeoutMs; }
    void setMarkerPolicy(TMarkerPolicy policy)  { m_markerPolicy = policy; }
    void setLibraryPath(const QString& path)    { m_libraryPath = path; }

    static QString       markerPolicyName(TMarkerPolicy policy);
    static TMarkerPolicy markerPolicyFromName(const QString& name, bool* ok = 0);

private:
    uint readUInt(QSettings& settings, const QString& key, uint defValue, uint maxValue);

    // members
    TAcquisitionConfig m_acquisition;
    int                m_captureTimeoutMs;
    TMarkerPolicy      m_markerPolicy;
    QString            m_libraryPath;
    QString            m_lastErrorStr;

    // constants
    static const QString c_acquisitionSection;
    static const QString c_sessionSection;
};

#endif // ASQE_SETTINGS_H
