/*
 *  Client interface for local Gree device access
 *
 *  Client configuration
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeConfig.hpp"
#include "greeUDP.hpp"
#include <fstream>
#include <memory>

#ifdef DEBUG
#include <iostream>
#endif

#define GREE_DEFAULT_LOCAL_PORT 7001
#define GREE_DEFAULT_BROADCAST "10.0.0.255"
#define GREE_DEFAULT_MAX_COUNT 10
#define GREE_DEFAULT_MIN_SCAN_AGE 60
#define GREE_DEFAULT_MAX_SCAN_AGE 86400


greeConfig::greeConfig()
{
	bind_address = "0.0.0.0";
	local_port = GREE_DEFAULT_LOCAL_PORT;
	broadcast_address = GREE_DEFAULT_BROADCAST;
	device_port = GREE_COMMAND_PORT;
	max_count = GREE_DEFAULT_MAX_COUNT;
	timeout_ms = GREE_DEFAULT_RECEIVE_TIMEOUT_MS;
	min_scan_age = GREE_DEFAULT_MIN_SCAN_AGE;
	max_scan_age = GREE_DEFAULT_MAX_SCAN_AGE;
	keep_keys = true;
	receiver_thread = false;
	m_lasterror = Gree::Error::NONE;
}


/* private */ bool greeConfig::setError(const std::string &detail)
{
	m_lasterror = Gree::Error::CONFIG;
	m_lasterrordetail = detail;
#ifdef DEBUG
	std::cout << "dbg: config: " << detail << "\n";
#endif
	return false;
}


bool greeConfig::LoadFile(const std::string &filename)
{
	std::string szFileContent;
	std::ifstream myfile (filename.c_str());
	if (!myfile.is_open())
		return setError("cannot open " + filename);

	std::string line;
	while (getline(myfile, line))
	{
		szFileContent.append(line);
		szFileContent.append("\n");
	}
	myfile.close();

	return LoadString(szFileContent);
}


bool greeConfig::LoadString(const std::string &szJson)
{
	Json::Value jConfig;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!jReader->parse(szJson.c_str(), szJson.c_str() + szJson.size(), &jConfig, &szErrors))
		return setError(szErrors);
	return Load(jConfig);
}


bool greeConfig::Load(const Json::Value &jConfig)
{
	if (!jConfig.isObject())
		return setError("configuration is not an object");

	if (jConfig.isMember("bind_address"))
	{
		if (!jConfig["bind_address"].isString())
			return setError("bind_address must be a string");
		bind_address = jConfig["bind_address"].asString();
	}
	if (jConfig.isMember("broadcast_address"))
	{
		if (!jConfig["broadcast_address"].isString())
			return setError("broadcast_address must be a string");
		broadcast_address = jConfig["broadcast_address"].asString();
	}
	if (jConfig.isMember("local_port"))
	{
		if (!jConfig["local_port"].isUInt() || (jConfig["local_port"].asUInt() > 65535))
			return setError("local_port out of range");
		local_port = (uint16_t)jConfig["local_port"].asUInt();
	}
	if (jConfig.isMember("device_port"))
	{
		if (!jConfig["device_port"].isUInt() || (jConfig["device_port"].asUInt() > 65535) || (jConfig["device_port"].asUInt() == 0))
			return setError("device_port out of range");
		device_port = (uint16_t)jConfig["device_port"].asUInt();
	}
	if (jConfig.isMember("max_count"))
	{
		if (!jConfig["max_count"].isInt())
			return setError("max_count must be an integer");
		max_count = jConfig["max_count"].asInt();
	}
	if (jConfig.isMember("timeout_ms"))
	{
		if (!jConfig["timeout_ms"].isInt())
			return setError("timeout_ms must be an integer");
		timeout_ms = jConfig["timeout_ms"].asInt();
	}
	if (jConfig.isMember("min_scan_age"))
	{
		if (!jConfig["min_scan_age"].isInt())
			return setError("min_scan_age must be an integer");
		min_scan_age = jConfig["min_scan_age"].asInt();
	}
	if (jConfig.isMember("max_scan_age"))
	{
		if (!jConfig["max_scan_age"].isInt())
			return setError("max_scan_age must be an integer");
		max_scan_age = jConfig["max_scan_age"].asInt();
	}
	if (jConfig.isMember("keep_keys"))
	{
		if (!jConfig["keep_keys"].isBool())
			return setError("keep_keys must be a boolean");
		keep_keys = jConfig["keep_keys"].asBool();
	}
	if (jConfig.isMember("receiver_thread"))
	{
		if (!jConfig["receiver_thread"].isBool())
			return setError("receiver_thread must be a boolean");
		receiver_thread = jConfig["receiver_thread"].asBool();
	}
	if (jConfig.isMember("aliases"))
	{
		if (!jConfig["aliases"].isObject())
			return setError("aliases must be an object");
		Json::Value::Members members = jConfig["aliases"].getMemberNames();
		for (size_t i = 0; i < members.size(); i++)
		{
			if (!jConfig["aliases"][members[i]].isString())
				return setError("alias " + members[i] + " must map to a mac");
			aliases[members[i]] = jConfig["aliases"][members[i]].asString();
		}
	}

	return isValid();
}


bool greeConfig::isValid()
{
	if (min_scan_age >= max_scan_age)
		return setError("min_scan_age must be smaller than max_scan_age");
	if (max_count <= 0)
		return setError("max_count must be positive");
	if (timeout_ms <= 0)
		return setError("timeout_ms must be positive");

	m_lasterror = Gree::Error::NONE;
	m_lasterrordetail.clear();
	return true;
}
