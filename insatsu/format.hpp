//  format.hpp -- boost::format injection
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

#ifndef insatsu_format_hpp_
#define insatsu_format_hpp_

/*! \file
 *  \brief Inject boost::format into the project's namespace
 *
 *  Log messages as well as program output use boost::format style
 *  positional arguments, such as \c %1$04x for a USB vendor ID.
 */

#include <boost/format.hpp>

namespace insatsu {

using boost::format;

}       // namespace insatsu

#endif  /* insatsu_format_hpp_ */
