/*
 *  Client interface for local Gree device access
 *
 *  Protocol variables
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeVars.hpp"

#ifdef DEBUG
#include <iostream>
#endif


namespace Gree {
  namespace Vars {
    static const Definition CATALOG[] = {
      { "Pow",          BOOLEAN, 1,   false },
      { "Mod",          INTEGER, 4,   false },
      { "SetTem",       INTEGER, 255, false },
      { "TemUn",        BOOLEAN, 1,   false },
      { "WdSpd",        INTEGER, 5,   false },
      { "Air",          BOOLEAN, 1,   false },
      { "Blo",          BOOLEAN, 1,   false },
      { "Health",       BOOLEAN, 1,   false },
      { "SwhSlp",       BOOLEAN, 1,   false },
      { "Lig",          BOOLEAN, 1,   false },
      { "SwingLfRig",   INTEGER, 6,   false },
      { "SwUpDn",       INTEGER, 11,  false },
      { "Quiet",        BOOLEAN, 1,   false },
      { "Tur",          BOOLEAN, 1,   false },
      { "StHt",         BOOLEAN, 1,   false },
      { "HeatCoolType", INTEGER, 255, false },
      { "TemRec",       BOOLEAN, 1,   false },
      { "SvSt",         BOOLEAN, 1,   false },
      { "TemSen",       INTEGER, 255, true },
      { "time",         STRING,  0,   false }
    };
    static const int CATALOG_SIZE = (int)(sizeof(CATALOG) / sizeof(CATALOG[0]));
  }; // namespace Vars
}; // namespace Gree


const Gree::Vars::Definition* Gree::Vars::find(const std::string &name)
{
	for (int i = 0; i < CATALOG_SIZE; i++)
	{
		if (name == CATALOG[i].name)
			return &CATALOG[i];
	}
	return nullptr;
}


std::vector<std::string> Gree::Vars::names()
{
	std::vector<std::string> result;
	for (int i = 0; i < CATALOG_SIZE; i++)
		result.push_back(CATALOG[i].name);
	return result;
}


bool Gree::Vars::parse_value(const Definition &definition, const std::string &literal, Json::Value &value)
{
	if (definition.domain == STRING)
	{
		value = Json::Value(literal);
		return true;
	}

	// unsigned byte, digits only
	if (literal.empty() || (literal.length() > 3))
		return false;
	int number = 0;
	for (size_t i = 0; i < literal.length(); i++)
	{
		if ((literal[i] < '0') || (literal[i] > '9'))
			return false;
		number = number * 10 + (literal[i] - '0');
	}
	if ((number > 255) || (number > definition.maxvalue))
		return false;

	value = Json::Value(number);
	return true;
}


greeVarBag::greeVarBag()
{
	m_lasterror = Gree::Error::NONE;
}


/* private */ bool greeVarBag::setError(Gree::Error::value error, const std::string &detail)
{
	m_lasterror = error;
	m_lasterrordetail = detail;
#ifdef DEBUG
	std::cout << "dbg: " << Gree::Error::name(error) << ": " << detail << "\n";
#endif
	return false;
}


bool greeVarBag::FromNames(const std::vector<std::string> &names)
{
	m_slots.clear();
	m_lasterror = Gree::Error::NONE;
	m_lasterrordetail.clear();

	for (size_t i = 0; i < names.size(); i++)
	{
		if (!Gree::Vars::find(names[i]))
		{
			m_slots.clear();
			return setError(Gree::Error::INVALID_VARIABLE, names[i]);
		}
		greeVarSlot &slot = m_slots[names[i]];
		slot.value = Json::Value();
		slot.read_pending = true;
		slot.write_pending = false;
	}
	return true;
}


bool greeVarBag::FromNameValuePairs(const std::vector<std::pair<std::string, std::string> > &pairs)
{
	m_slots.clear();
	m_lasterror = Gree::Error::NONE;
	m_lasterrordetail.clear();

	for (size_t i = 0; i < pairs.size(); i++)
	{
		const Gree::Vars::Definition *definition = Gree::Vars::find(pairs[i].first);
		if (!definition)
		{
			m_slots.clear();
			return setError(Gree::Error::INVALID_VARIABLE, pairs[i].first);
		}
		if (definition->readonly)
		{
			m_slots.clear();
			return setError(Gree::Error::INVALID_VARIABLE, pairs[i].first + " is read only");
		}

		Json::Value value;
		if (!Gree::Vars::parse_value(*definition, pairs[i].second, value))
		{
			m_slots.clear();
			return setError(Gree::Error::INVALID_VALUE, pairs[i].first + "=" + pairs[i].second);
		}

		greeVarSlot &slot = m_slots[pairs[i].first];
		slot.value = value;
		slot.read_pending = false;
		slot.write_pending = true;
	}
	return true;
}


std::vector<std::string> greeVarBag::PendingReads() const
{
	std::vector<std::string> result;
	for (std::map<std::string, greeVarSlot>::const_iterator it = m_slots.begin(); it != m_slots.end(); ++it)
	{
		if (it->second.read_pending)
			result.push_back(it->first);
	}
	return result;
}


std::vector<std::pair<std::string, Json::Value> > greeVarBag::PendingWrites() const
{
	std::vector<std::pair<std::string, Json::Value> > result;
	for (std::map<std::string, greeVarSlot>::const_iterator it = m_slots.begin(); it != m_slots.end(); ++it)
	{
		if (it->second.write_pending)
			result.push_back(std::make_pair(it->first, it->second.value));
	}
	return result;
}


bool greeVarBag::ApplyReadResult(const std::string &name, const Json::Value &value)
{
	std::map<std::string, greeVarSlot>::iterator it = m_slots.find(name);
	if (it == m_slots.end())
		return false;
	it->second.value = value;
	it->second.read_pending = false;
	return true;
}


bool greeVarBag::ApplyWriteResult(const std::string &name, const Json::Value &value)
{
	std::map<std::string, greeVarSlot>::iterator it = m_slots.find(name);
	if (it == m_slots.end())
		return false;
	it->second.value = value;
	it->second.write_pending = false;
	return true;
}


bool greeVarBag::Set(const std::string &name, const Json::Value &value)
{
	const Gree::Vars::Definition *definition = Gree::Vars::find(name);
	if (!definition)
		return setError(Gree::Error::INVALID_VARIABLE, name);
	if (definition->readonly)
		return setError(Gree::Error::INVALID_VARIABLE, name + " is read only");

	std::map<std::string, greeVarSlot>::iterator it = m_slots.find(name);
	if (it == m_slots.end())
	{
		greeVarSlot &slot = m_slots[name];
		slot.read_pending = false;
		it = m_slots.find(name);
	}
	it->second.value = value;
	it->second.write_pending = true;
	return true;
}


const greeVarSlot* greeVarBag::Get(const std::string &name) const
{
	std::map<std::string, greeVarSlot>::const_iterator it = m_slots.find(name);
	if (it == m_slots.end())
		return nullptr;
	return &it->second;
}


Json::Value greeVarBag::ToReportMap() const
{
	Json::Value jReport(Json::objectValue);
	for (std::map<std::string, greeVarSlot>::const_iterator it = m_slots.begin(); it != m_slots.end(); ++it)
		jReport[it->first] = it->second.value;
	return jReport;
}
