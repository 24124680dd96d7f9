/*
 *  Client interface for local Gree device access
 *
 *  Device registry: the devices found by the last scan, keyed by MAC, and
 *  the alias table that maps friendly names onto those MACs.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeRegistry
#define _greeRegistry

#include "greeAPI.hpp"
#include <json/json.h>
#include <string>
#include <vector>
#include <map>


struct greeDevice
{
	std::string mac;
	std::string address;
	Json::Value scaninfo;
	std::string key;     // empty until bound

	bool isBound() const { return !key.empty(); }
};


class greeRegistry
{
public:
	greeRegistry();

	// Replaces the device map with the scan results. With `keepKeys` set a
	// device that reappears under the same MAC keeps its session key.
	void RecordScan(const std::vector<greeScanResult> &results, const bool keepKeys = true);

	// Alias table first, else `target` is taken to be a MAC
	std::string Resolve(const std::string &target) const;

	greeDevice* Get(const std::string &mac);
	const greeDevice* Get(const std::string &mac) const;

	bool RecordBind(const std::string &mac, const std::string &key);
	bool ForgetKey(const std::string &mac);

	void setAlias(const std::string &alias, const std::string &mac) { m_aliases[alias] = mac; }
	void setAliases(const std::map<std::string, std::string> &aliases) { m_aliases = aliases; }
	bool removeAlias(const std::string &alias) { return (m_aliases.erase(alias) > 0); }
	const std::map<std::string, std::string> &getAliases() const { return m_aliases; }

	std::vector<std::string> devices() const;
	const std::map<std::string, greeDevice> &getDevices() const { return m_devices; }
	size_t size() const { return m_devices.size(); }
	bool empty() const { return m_devices.empty(); }

	Gree::Error::value getlasterror() const { return m_lasterror; }
	const std::string &getlasterrordetail() const { return m_lasterrordetail; }

private:
	bool setError(Gree::Error::value error, const std::string &detail) const;

	std::map<std::string, greeDevice> m_devices;
	std::map<std::string, std::string> m_aliases;
	mutable Gree::Error::value m_lasterror;
	mutable std::string m_lasterrordetail;
};

#endif // _greeRegistry
