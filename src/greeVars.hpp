/*
 *  Client interface for local Gree device access
 *
 *  Protocol variables and the bag that carries them through read and write
 *  operations.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeVars
#define _greeVars

#include "greeErrors.hpp"
#include <json/json.h>
#include <string>
#include <vector>
#include <map>
#include <utility>


namespace Gree {
  namespace Vars {
    static const std::string POW = "Pow";                    // power: 0 off, 1 on
    static const std::string MOD = "Mod";                    // mode: 0 auto, 1 cool, 2 dry, 3 fan, 4 heat
    static const std::string SET_TEM = "SetTem";             // set temperature in TemUn units
    static const std::string TEM_UN = "TemUn";               // temperature unit: 0 Celsius, 1 Fahrenheit
    static const std::string WD_SPD = "WdSpd";               // fan speed: 0 auto, 1 low .. 5 high
    static const std::string AIR = "Air";                    // fresh air valve
    static const std::string BLO = "Blo";                    // x-fan, keeps blowing after shutdown
    static const std::string HEALTH = "Health";              // anion generator
    static const std::string SWH_SLP = "SwhSlp";             // sleep mode
    static const std::string LIG = "Lig";                    // display and indicator lights
    static const std::string SWING_LF_RIG = "SwingLfRig";    // horizontal swing: 0 default, 1 full, 2-6 fixed
    static const std::string SW_UP_DN = "SwUpDn";            // vertical swing: 0 default, 1 full, 2-6 fixed, 7-11 partial
    static const std::string QUIET = "Quiet";                // quiet mode
    static const std::string TUR = "Tur";                    // turbo
    static const std::string ST_HT = "StHt";                 // 8 degrees heat protection
    static const std::string HEAT_COOL_TYPE = "HeatCoolType";
    static const std::string TEM_REC = "TemRec";             // Fahrenheit disambiguation bit
    static const std::string SV_ST = "SvSt";                 // energy saving
    static const std::string TEM_SEN = "TemSen";             // room temperature + 40 (read only)
    static const std::string TIME = "time";                  // device time "2018-05-11 19:42:01"

    enum Domain {
      BOOLEAN,
      INTEGER,
      STRING
    }; // enum Domain

    struct Definition {
      const char *name;
      Domain domain;
      int maxvalue;       // inclusive upper bound for INTEGER
      bool readonly;
    };

    // nullptr for names outside the catalog
    const Definition* find(const std::string &name);

    // Names of all catalog entries, in catalog order
    std::vector<std::string> names();

    // Validates `literal` against the domain of `definition`
    bool parse_value(const Definition &definition, const std::string &literal, Json::Value &value);
  }; // namespace Vars
}; // namespace Gree


struct greeVarSlot
{
	Json::Value value;
	bool read_pending;
	bool write_pending;
};


class greeVarBag
{
public:
	greeVarBag();

	// Fill the bag with slots waiting for a network read
	bool FromNames(const std::vector<std::string> &names);
	// Fill the bag with validated slots waiting for a network write
	bool FromNameValuePairs(const std::vector<std::pair<std::string, std::string> > &pairs);

	std::vector<std::string> PendingReads() const;
	std::vector<std::pair<std::string, Json::Value> > PendingWrites() const;

	// Both ignore names that have no slot in this bag
	bool ApplyReadResult(const std::string &name, const Json::Value &value);
	bool ApplyWriteResult(const std::string &name, const Json::Value &value);

	// Local edit of an existing slot, marks it for writing
	bool Set(const std::string &name, const Json::Value &value);
	const greeVarSlot* Get(const std::string &name) const;

	Json::Value ToReportMap() const;

	bool empty() const { return m_slots.empty(); }
	size_t size() const { return m_slots.size(); }
	bool contains(const std::string &name) const { return (m_slots.find(name) != m_slots.end()); }

	Gree::Error::value getlasterror() const { return m_lasterror; }
	const std::string &getlasterrordetail() const { return m_lasterrordetail; }

private:
	bool setError(Gree::Error::value error, const std::string &detail);

	std::map<std::string, greeVarSlot> m_slots;
	Gree::Error::value m_lasterror;
	std::string m_lasterrordetail;
};

#endif // _greeVars
