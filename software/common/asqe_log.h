/*
 *  asqe_log.h - Logging categories of the ASQE spectrometer API
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

#ifndef ASQE_LOG_H
#define ASQE_LOG_H

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES, e.g. "asqe.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcAsqeDevice)
Q_DECLARE_LOGGING_CATEGORY(lcAsqeFlash)
Q_DECLARE_LOGGING_CATEGORY(lcAsqeCalibration)
Q_DECLARE_LOGGING_CATEGORY(lcAsqeAcquisition)

#endif // ASQE_LOG_H
