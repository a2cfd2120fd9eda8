/*
 *  asqe_settings.cpp - Persistent settings of ASQE spectrometer sessions
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

#include "asqe_settings.h"
#include "asqe_api.h"
#include "asqe_log.h"

#include <QFileInfo>
#include <QSettings>

// --------------------------------------
//      AsqeSettings implementation
// --------------------------------------
const QString AsqeSettings::c_acquisitionSection = "Acquisition";
const QString AsqeSettings::c_sessionSection     = "Session";

AsqeSettings::AsqeSettings()
    : m_acquisition(), m_captureTimeoutMs(AsqeDevice::DEFAULT_CAPTURE_TIMEOUT_MS),
      m_markerPolicy(MARKER_TRUNCATE_AT_CAP)
{
}

QString AsqeSettings::markerPolicyName(TMarkerPolicy policy)
{
    return policy == MARKER_REQUIRED ? "require" : "truncate";
}

TMarkerPolicy AsqeSettings::markerPolicyFromName(const QString& name, bool* ok)
{
    QString value = name.trimmed().toLower();
    if (ok)
        *ok = true;

    if (value == "require")
        return MARKER_REQUIRED;
    if (value != "truncate" && ok)
        *ok = false;

    return MARKER_TRUNCATE_AT_CAP;
}

uint AsqeSettings::readUInt(QSettings& settings, const QString& key, uint defValue, uint maxValue)
{
    if (!settings.contains(key))
        return defValue;

    bool ok = false;
    uint value = settings.value(key).toUInt(&ok);
    if (!ok || value > maxValue)
    {
        qCWarning(lcAsqeDevice) << "Ignoring invalid setting" << key
                                << settings.value(key).toString();
        return defValue;
    }
    return value;
}

bool AsqeSettings::load(const QString& fileName)
{
    m_lastErrorStr.clear();

    if (!QFileInfo(fileName).exists())
    {
        m_lastErrorStr = QString("Settings file %1 does not exist").arg(fileName);
        return false;
    }

    QSettings settings(fileName, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError)
    {
        m_lastErrorStr = QString("Cannot read settings file %1").arg(fileName);
        return false;
    }

    TAcquisitionConfig defaults;

    settings.beginGroup(c_acquisitionSection);
    m_acquisition.scans          = readUInt(settings, "scans",          defaults.scans,          0xFFFF);
    m_acquisition.blankScans     = readUInt(settings, "blankScans",     defaults.blankScans,     0xFFFF);
    m_acquisition.exposureTimeUs = readUInt(settings, "exposureTimeUs", defaults.exposureTimeUs, 0xFFFFFFFF);
    m_acquisition.scanMode       = readUInt(settings, "scanMode",       defaults.scanMode,       0xFF);
    m_acquisition.pixelStart     = readUInt(settings, "pixelStart",     defaults.pixelStart,     0xFFFF);
    m_acquisition.pixelEnd       = readUInt(settings, "pixelEnd",       defaults.pixelEnd,       0xFFFF);
    m_acquisition.reductionMode  = readUInt(settings, "reductionMode",  defaults.reductionMode,  0xFF);
    settings.endGroup();

    settings.beginGroup(c_sessionSection);
    bool ok = true;
    int timeout = settings.value("captureTimeoutMs", AsqeDevice::DEFAULT_CAPTURE_TIMEOUT_MS).toInt(&ok);
    m_captureTimeoutMs = ok ? timeout : int(AsqeDevice::DEFAULT_CAPTURE_TIMEOUT_MS);

    QString policy = settings.value("markerPolicy", markerPolicyName(MARKER_TRUNCATE_AT_CAP)).toString();
    m_markerPolicy = markerPolicyFromName(policy, &ok);
    if (!ok)
        qCWarning(lcAsqeDevice) << "Unknown marker policy" << policy << "- using truncate";

    m_libraryPath = settings.value("libraryPath", QString()).toString();
    settings.endGroup();

    return true;
}

bool AsqeSettings::save(const QString& fileName)
{
    m_lastErrorStr.clear();

    QSettings settings(fileName, QSettings::IniFormat);

    settings.beginGroup(c_acquisitionSection);
    settings.setValue("scans",          m_acquisition.scans);
    settings.setValue("blankScans",     m_acquisition.blankScans);
    settings.setValue("exposureTimeUs", m_acquisition.exposureTimeUs);
    settings.setValue("scanMode",       m_acquisition.scanMode);
    settings.setValue("pixelStart",     m_acquisition.pixelStart);
    settings.setValue("pixelEnd",       m_acquisition.pixelEnd);
    settings.setValue("reductionMode",  m_acquisition.reductionMode);
    settings.endGroup();

    settings.beginGroup(c_sessionSection);
    settings.setValue("captureTimeoutMs", m_captureTimeoutMs);
    settings.setValue("markerPolicy",     markerPolicyName(m_markerPolicy));
    settings.setValue("libraryPath",      m_libraryPath);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError)
    {
        m_lastErrorStr = QString("Cannot write settings file %1").arg(fileName);
        return false;
    }

    return true;
}

void AsqeSettings::applyTo(AsqeDevice& device)
{
    device.setCaptureTimeout(m_captureTimeoutMs);
    device.setMarkerPolicy(m_markerPolicy);
}
