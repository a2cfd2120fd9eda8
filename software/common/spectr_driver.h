/*
 *  spectr_driver.h - Binding to the native ASQE spectrometer driver library
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

#ifndef ASQE_SPECTR_DRIVER_H
#define ASQE_SPECTR_DRIVER_H

#include <QLibrary>
#include <QString>

#include "asqe_types.h"

//
// Interface to the native driver/firmware layer.
//
// Every call except disconnectDevice() returns a status code where 0 means
// success. Discovery, transport and command encoding all live behind this
// interface. Implementations are not thread safe: a single driver instance
// serves a single device session.
//
class SpectrDriver
{
public:
    enum { STATUS_OK = 0 };

    virtual ~SpectrDriver() {}

    // serial may be null to connect to the first device found
    virtual int  connectToDevice(const char* serial) = 0;
    virtual void disconnectDevice() = 0;

    virtual int setAcquisitionParameters(uint16 numOfScans, uint16 numOfBlankScans,
                                         uint8 scanMode, uint32 exposureTimeUs) = 0;
    virtual int setFrameFormat(uint16 numOfStartElement, uint16 numOfEndElement,
                               uint8 reductionMode, uint16* numOfPixelsInFrame) = 0;
    virtual int getStatus(uint8* statusFlags, uint16* framesInMemory) = 0;
    virtual int getFrame(uint16* framePixelsBuffer, uint16 maxLen) = 0;
    virtual int triggerAcquisition() = 0;
    virtual int readFlash(uint8* buffer, uint32 absoluteOffset, uint32 bytesToRead) = 0;
};

//
// SpectrDriver implementation over the vendor supplied shared library
// (libspectr.so, libspectr.dylib or libspectr.dll) resolved at runtime.
//
// load() must succeed before the device can be used. Until then every
// call returns STATUS_NOT_LOADED.
//
class LibSpectrDriver: public SpectrDriver
{
public:
    enum { STATUS_NOT_LOADED = -1000 };

    LibSpectrDriver();
    ~LibSpectrDriver();

    // default library name for this platform
    static QString defaultLibraryName();

    // loads library and resolves all entry points
    bool load(const QString& libraryPath = QString());
    void unload();
    bool isLoaded() { return m_loaded; }

    QString& getLastError() { return m_lastErrorStr; }

    // SpectrDriver
    int  connectToDevice(const char* serial);
    void disconnectDevice();
    int  setAcquisitionParameters(uint16 numOfScans, uint16 numOfBlankScans,
                                  uint8 scanMode, uint32 exposureTimeUs);
    int  setFrameFormat(uint16 numOfStartElement, uint16 numOfEndElement,
                        uint8 reductionMode, uint16* numOfPixelsInFrame);
    int  getStatus(uint8* statusFlags, uint16* framesInMemory);
    int  getFrame(uint16* framePixelsBuffer, uint16 maxLen);
    int  triggerAcquisition();
    int  readFlash(uint8* buffer, uint32 absoluteOffset, uint32 bytesToRead);

private:
    // native entry points
    typedef int  (*TConnectToDevice)(const char*);
    typedef void (*TDisconnectDevice)();
    typedef int  (*TSetAcquisitionParameters)(uint16, uint16, uint8, uint32);
    typedef int  (*TSetFrameFormat)(uint16, uint16, uint8, uint16*);
    typedef int  (*TGetStatus)(uint8*, uint16*);
    typedef int  (*TGetFrame)(uint16*, uint16);
    typedef int  (*TTriggerAcquisition)();
    typedef int  (*TReadFlash)(uint8*, uint32, uint32);

    template <typename T>
    bool resolve(T& func, const char* name);

    // members
    QLibrary                   m_library;
    bool                       m_loaded;
    QString                    m_lastErrorStr;

    TConnectToDevice           m_connectToDevice;
    TDisconnectDevice          m_disconnectDevice;
    TSetAcquisitionParameters  m_setAcquisitionParameters;
    TSetFrameFormat            m_setFrameFormat;
    TGetStatus                 m_getStatus;
    TGetFrame                  m_getFrame;
    TTriggerAcquisition        m_triggerAcquisition;
    TReadFlash                 m_readFlash;
};

#endif // ASQE_SPECTR_DRIVER_H
