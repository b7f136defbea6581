//  decorator.hpp -- add responsibilities to an object
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

#ifndef insatsu_pattern_decorator_hpp_
#define insatsu_pattern_decorator_hpp_

namespace insatsu {

//!  Wraps an instance of \a T and forwards its public API to it
/*!  Only specialisations exist.  They define a \c ptr to the wrapped
 *   instance and a \c base_ typedef so that derived classes need only
 *   override the calls they add behaviour to.
 */
template< typename T > class decorator;

}       // namespace insatsu

#endif  /* insatsu_pattern_decorator_hpp_ */
