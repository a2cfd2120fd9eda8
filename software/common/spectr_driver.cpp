/*
 *  spectr_driver.cpp - Binding to the native ASQE spectrometer driver library
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

#include "spectr_driver.h"
#include "asqe_log.h"

#include <QtGlobal>

// --------------------------------------
//     LibSpectrDriver implementation
// --------------------------------------
LibSpectrDriver::LibSpectrDriver()
    : m_loaded(false), m_connectToDevice(0), m_disconnectDevice(0),
      m_setAcquisitionParameters(0), m_setFrameFormat(0), m_getStatus(0),
      m_getFrame(0), m_triggerAcquisition(0), m_readFlash(0)
{
    // library is loaded when load() is called - later
}

LibSpectrDriver::~LibSpectrDriver()
{
    unload();
}

QString LibSpectrDriver::defaultLibraryName()
{
#if defined( Q_OS_WIN )
  #if QT_POINTER_SIZE == 8
    return "libspectr64bit.dll";
  #else
    return "libspectr.dll";
  #endif
#elif defined( Q_OS_MACX )
    return "libspectr.dylib";
#else
    return "libspectr.so";
#endif
}

template <typename T>
bool LibSpectrDriver::resolve(T& func, const char* name)
{
    func = reinterpret_cast<T>(m_library.resolve(name));
    if (!func)
    {
        m_lastErrorStr = QString("Entry point %1 not found in %2")
                             .arg(name).arg(m_library.fileName());
        return false;
    }
    return true;
}

bool LibSpectrDriver::load(const QString& libraryPath)
{
    unload();
    m_lastErrorStr.clear();

    m_library.setFileName(libraryPath.isEmpty() ? defaultLibraryName() : libraryPath);
    if (!m_library.load())
    {
        m_lastErrorStr = m_library.errorString();
        qCWarning(lcAsqeDevice) << "Cannot load driver library:" << m_lastErrorStr;
        return false;
    }

    bool success = resolve(m_connectToDevice,          "connectToDevice")
                && resolve(m_disconnectDevice,         "disconnectDevice")
                && resolve(m_setAcquisitionParameters, "setAcquisitionParameters")
                && resolve(m_setFrameFormat,           "setFrameFormat")
                && resolve(m_getStatus,                "getStatus")
                && resolve(m_getFrame,                 "getFrame")
                && resolve(m_triggerAcquisition,       "triggerAcquisition")
                && resolve(m_readFlash,                "readFlash");

    if (!success)
    {
        qCWarning(lcAsqeDevice) << m_lastErrorStr;
        QString error = m_lastErrorStr;
        unload();
        m_lastErrorStr = error;
        return false;
    }

    qCDebug(lcAsqeDevice) << "Loaded driver library" << m_library.fileName();
    m_loaded = true;
    return true;
}

void LibSpectrDriver::unload()
{
    if (m_library.isLoaded())
        m_library.unload();

    m_loaded = false;
    m_connectToDevice = 0;
    m_disconnectDevice = 0;
    m_setAcquisitionParameters = 0;
    m_setFrameFormat = 0;
    m_getStatus = 0;
    m_getFrame = 0;
    m_triggerAcquisition = 0;
    m_readFlash = 0;
}

int LibSpectrDriver::connectToDevice(const char* serial)
{
    return m_loaded ? m_connectToDevice(serial) : STATUS_NOT_LOADED;
}

void LibSpectrDriver::disconnectDevice()
{
    if (m_loaded)
        m_disconnectDevice();
}

int LibSpectrDriver::setAcquisitionParameters(uint16 numOfScans, uint16 numOfBlankScans,
                                              uint8 scanMode, uint32 exposureTimeUs)
{
    if (!m_loaded)
        return STATUS_NOT_LOADED;
    return m_setAcquisitionParameters(numOfScans, numOfBlankScans, scanMode, exposureTimeUs);
}

int LibSpectrDriver::setFrameFormat(uint16 numOfStartElement, uint16 numOfEndElement,
                                    uint8 reductionMode, uint16* numOfPixelsInFrame)
{
    if (!m_loaded)
        return STATUS_NOT_LOADED;
    return m_setFrameFormat(numOfStartElement, numOfEndElement, reductionMode, numOfPixelsInFrame);
}

int LibSpectrDriver::getStatus(uint8* statusFlags, uint16* framesInMemory)
{
    return m_loaded ? m_getStatus(statusFlags, framesInMemory) : STATUS_NOT_LOADED;
}

int LibSpectrDriver::getFrame(uint16* framePixelsBuffer, uint16 maxLen)
{
    return m_loaded ? m_getFrame(framePixelsBuffer, maxLen) : STATUS_NOT_LOADED;
}

int LibSpectrDriver::triggerAcquisition()
{
    return m_loaded ? m_triggerAcquisition() : STATUS_NOT_LOADED;
}

int LibSpectrDriver::readFlash(uint8* buffer, uint32 absoluteOffset, uint32 bytesToRead)
{
    return m_loaded ? m_readFlash(buffer, absoluteOffset, bytesToRead) : STATUS_NOT_LOADED;
}
