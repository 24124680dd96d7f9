/*
 *  Client interface for local Gree device access
 *
 *  Client configuration. Loaded from a JSON file of the form:
 *
 *	{
 *	  "bind_address": "0.0.0.0",
 *	  "local_port": 7001,
 *	  "broadcast_address": "10.0.0.255",
 *	  "device_port": 7000,
 *	  "max_count": 10,
 *	  "timeout_ms": 3000,
 *	  "min_scan_age": 60,
 *	  "max_scan_age": 86400,
 *	  "keep_keys": true,
 *	  "receiver_thread": false,
 *	  "aliases": { "living": "f4911e7aca59" }
 *	}
 *
 *  Every field is optional, missing fields keep their default. Scan ages
 *  are in seconds.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeConfig
#define _greeConfig

#ifndef GREE_CONFIG_FILE
#define GREE_CONFIG_FILE "gree-devices.json"
#endif

#include "greeErrors.hpp"
#include <json/json.h>
#include <string>
#include <map>
#include <cstdint>


class greeConfig
{
public:
	greeConfig();

	bool LoadFile(const std::string &filename = GREE_CONFIG_FILE);
	bool LoadString(const std::string &szJson);
	bool Load(const Json::Value &jConfig);

	// min_scan_age < max_scan_age, max_count > 0, timeout_ms > 0
	bool isValid();

	std::string bind_address;
	uint16_t local_port;
	std::string broadcast_address;
	uint16_t device_port;
	int max_count;
	int timeout_ms;
	long min_scan_age;
	long max_scan_age;
	bool keep_keys;
	bool receiver_thread;
	std::map<std::string, std::string> aliases;

	Gree::Error::value getlasterror() const { return m_lasterror; }
	const std::string &getlasterrordetail() const { return m_lasterrordetail; }

private:
	bool setError(const std::string &detail);

	Gree::Error::value m_lasterror;
	std::string m_lasterrordetail;
};

#endif // _greeConfig
