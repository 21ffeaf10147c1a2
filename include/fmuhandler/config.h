/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.

NOTE TO USERS:
This header file is meant for internal use in this library, and should
normally not be included directly by client code.  Its purpose is to
aid in maintaining a cross-platform code base.

NOTE TO CONTRIBUTORS:
This file intentionally has a ".h" extension, as it is supposed to
be a valid C header.  C++-specific code should therefore be placed in
#ifdef __cplusplus blocks.
*/
#ifndef FMUHANDLER_CONFIG_H
#define FMUHANDLER_CONFIG_H

// Program name and version number
#define FMUHANDLER_PROGRAM_NAME "fmuhandler"

#define FMUHANDLER_VERSION_MAJOR 0
#define FMUHANDLER_VERSION_MINOR 1
#define FMUHANDLER_VERSION_PATCH 0

#define FMUHANDLER_VERSION_STRINGIFY(a, b, c) #a "." #b "." #c
#define FMUHANDLER_VERSION_STRINGIFY_EXPAND(a, b, c) FMUHANDLER_VERSION_STRINGIFY(a, b, c)
#define FMUHANDLER_VERSION_STRING FMUHANDLER_VERSION_STRINGIFY_EXPAND( \
    FMUHANDLER_VERSION_MAJOR, FMUHANDLER_VERSION_MINOR, FMUHANDLER_VERSION_PATCH)

#define FMUHANDLER_PROGRAM_NAME_VERSION FMUHANDLER_PROGRAM_NAME " " FMUHANDLER_VERSION_STRING

// The FMI version whose model description format is supported.
#define FMUHANDLER_FMI_VERSION "2.0"

// Microsoft Visual C++ version macros
#ifdef _MSC_VER
#   define FMUHANDLER_MSC14_VER 1900 // VS 2015
#endif

// Support for 'noexcept' (C++11) was introduced in Visual Studio 2015
#ifdef __cplusplus
#   if defined(_MSC_VER) && (_MSC_VER < FMUHANDLER_MSC14_VER)
#       define FMUHANDLER_NOEXCEPT throw()
#   else
#       define FMUHANDLER_NOEXCEPT noexcept
#   endif
#endif

// This is as good a place as any to put top-level documentation.
/**
\mainpage

fmuhandler is a C++ library for inspecting and editing the model description
of [FMI](https://www.fmi-standard.org) 2.0 Functional Mock-up Units.

An FMU is opened with fmuhandler::FMU, which gives access to the variables
declared in its `modelDescription.xml` (see fmuhandler::ModelDescription and
fmuhandler::model::ScalarVariable).  Variables can be queried, given new start
values, or removed, and the result is written back into an FMU archive.  A
model description is always checked against the FMI 2.0 XML schema (see
fmuhandler::SchemaValidator) before it is written.
*/

#endif // header guard
