//  dialect.cpp -- per printer model capabilities and command templates
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "dialect.hpp"
#include "exception.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

namespace {

const byte cut_full[]    = { LF, LF, LF, GS, UPPER_V, 0x00 };
const byte cut_partial[] = { LF, LF, LF, GS, UPPER_V, 0x01 };

#define BYTES(array) byte_buffer (array, sizeof (array) / sizeof (*array))

class snbc : public dialect
{
public:
  snbc ()
    : dialect (SNBC, "snbc")
  {
    const byte select[]   = { ESC, EQUAL, 0x01 };
    const byte deselect[] = { ESC, EQUAL, 0x00 };

    add_feature_(STATUS_PUSH);
    add_feature_(PERIPHERAL_SELECT);
    add_feature_(FULL_CUT);
    add_feature_(PARTIAL_CUT);
    add_feature_(CODE128_BLOCK);

    add_command_(SELECT_PRINTER, BYTES (select));
    add_command_(DESELECT_PRINTER, BYTES (deselect));
    add_command_(CUT_PAPER, BYTES (cut_full));
    add_command_(CUT_PAPER_PARTIALLY, BYTES (cut_partial));
  }

  uint8_t
  barcode_width (int requested) const
  {
    return (2 <= requested && requested <= 6 ? requested : 2);
  }

  status_protocol
  status_protocol_type () const
  {
    return STATUS_BLOCK;
  }
};

class p3 : public dialect
{
public:
  p3 ()
    : dialect (P3, "p3")
  {
    const byte select[]   = { ESC, EQUAL, 0x01 };
    const byte deselect[] = { ESC, EQUAL, 0x02 };
    const byte partial[]  = { LF, LF, LF, ESC, LOWER_M };
    const byte request[]  = { DLE, EOT, 0x01 };

    add_feature_(PERIPHERAL_SELECT);
    add_feature_(PARTIAL_CUT);
    add_feature_(SERIAL_NUMBER);

    add_command_(SELECT_PRINTER, BYTES (select));
    add_command_(DESELECT_PRINTER, BYTES (deselect));
    add_command_(CUT_PAPER_PARTIALLY, BYTES (partial));
    add_command_(REQUEST_STATUS, BYTES (request));
  }

  uint8_t
  barcode_width (int requested) const
  {
    return (1 <= requested && requested <= 6 ? requested : 3);
  }

  status_protocol
  status_protocol_type () const
  {
    return STATUS_UNDECODED;
  }
};

//  Wider modules push long Code128 symbols past the printable area so
//  the narrowest module width is used whatever is asked for.
class epic : public dialect
{
public:
  epic ()
    : dialect (EPIC, "epic")
  {
    add_feature_(FULL_CUT);
    add_feature_(PARTIAL_CUT);
    add_feature_(COMPACT_BARCODE);

    add_command_(CUT_PAPER, BYTES (cut_full));
    add_command_(CUT_PAPER_PARTIALLY, BYTES (cut_partial));
  }

  uint8_t
  barcode_width (int) const
  {
    return 1;
  }

  status_protocol
  status_protocol_type () const
  {
    return STATUS_POLLS;
  }

  double
  settle_time () const
  {
    return 3.0;
  }
};

class unknown : public dialect
{
public:
  unknown ()
    : dialect (UNKNOWN, "unknown")
  {}

  uint8_t
  barcode_width (int) const
  {
    BOOST_THROW_EXCEPTION
      (unsupported ("barcode width not known for this printer"));
  }

  status_protocol
  status_protocol_type () const
  {
    return STATUS_UNDECODED;
  }
};

#undef BYTES

}       // namespace

dialect::dialect (model m, const std::string& name)
  : id_(m), name_(name)
{}

dialect::model
dialect::id () const
{
  return id_;
}

const std::string&
dialect::name () const
{
  return name_;
}

bool
dialect::supports (feature f) const
{
  return features_.count (f);
}

const byte_buffer&
dialect::command (operation op) const
{
  std::map< operation, byte_buffer >::const_iterator it
    = commands_.find (op);

  if (commands_.end () == it)
    {
      log::brief (log::ESCPOS_DRIVER, "%1%: no command for operation %2%")
        % name_
        % op;
      BOOST_THROW_EXCEPTION (unsupported ());
    }
  return it->second;
}

bool
dialect::has_command (operation op) const
{
  return commands_.count (op);
}

double
dialect::settle_time () const
{
  return 0.0;
}

void
dialect::add_feature_(feature f)
{
  features_.insert (f);
}

void
dialect::add_command_(operation op, const byte_buffer& bytes)
{
  commands_[op] = bytes;
}

dialect::ptr
dialect::get (model m)
{
  static const ptr snbc_ (make_shared< snbc > ());
  static const ptr p3_ (make_shared< p3 > ());
  static const ptr epic_ (make_shared< epic > ());
  static const ptr unknown_ (make_shared< unknown > ());

  switch (m)
    {
    case SNBC: return snbc_;
    case P3  : return p3_;
    case EPIC: return epic_;
    default  : return unknown_;
    }
}

dialect::ptr
dialect::infer (uint16_t vendor_id, uint16_t product_id,
                const std::string& manufacturer)
{
  using boost::algorithm::starts_with;

  if (0x154f == vendor_id && 0x154f == product_id)
    return get (SNBC);

  /**/ if (starts_with (manufacturer, "SNBC"))       return get (SNBC);
  else if (starts_with (manufacturer, "Custom SpA")) return get (P3);
  else if (starts_with (manufacturer, "TransAct"))   return get (EPIC);

  log::brief (log::ESCPOS_DRIVER, "no dialect for %1$04x:%2$04x (%3%)")
    % vendor_id
    % product_id
    % manufacturer;

  return get (UNKNOWN);
}

dialect::ptr
dialect::lookup (const std::string& name)
{
  std::string s (boost::algorithm::to_lower_copy (name));

  /**/ if ("snbc"    == s) return get (SNBC);
  else if ("p3"      == s) return get (P3);
  else if ("epic"    == s) return get (EPIC);
  else if ("unknown" == s) return get (UNKNOWN);

  BOOST_THROW_EXCEPTION
    (invalid_argument ("unknown printer model: '" + name + "'"));
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
