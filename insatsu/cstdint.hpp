//  cstdint.hpp -- fixed width integral types
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

#ifndef insatsu_cstdint_hpp_
#define insatsu_cstdint_hpp_

/*! \file
 *  \brief Inject standard compliant fixed width integral types
 *
 *  We want to use the fixed width integral types as if they were part
 *  of the \c insatsu namespace without worrying about whether they
 *  come from the standard library or from Boost.
 */

#if __cplusplus >= 201103L

#include <cstdint>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/cstdint.hpp>
#define NAMESPACE boost

#endif

namespace insatsu {

using NAMESPACE::int16_t;
using NAMESPACE::int32_t;
using NAMESPACE::uint8_t;
using NAMESPACE::uint16_t;
using NAMESPACE::uint32_t;

}       // namespace insatsu

#undef NAMESPACE

#endif  /* insatsu_cstdint_hpp_ */
