//  thread.hpp -- thread identification
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
//  Copyright (C) 2026  Insatsu contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Insatsu' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef insatsu_thread_hpp_
#define insatsu_thread_hpp_

/*! \file
 *  \brief Inject a standard compliant \c this_thread namespace
 *
 *  Log messages are tagged with the identifier of the thread that
 *  created them.  This header lets us get at that identifier without
 *  caring whether \c std::thread or \c boost::thread provides it.
 */

#if __cplusplus >= 201103L

#include <thread>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/thread/thread.hpp>
#define NAMESPACE boost

#endif

namespace insatsu {

using NAMESPACE::thread;
namespace this_thread = NAMESPACE::this_thread;

}       // namespace insatsu

#undef NAMESPACE

#endif  /* insatsu_thread_hpp_ */
