/*
 *  Client interface for local Gree device access
 *
 *  Device registry
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeRegistry.hpp"

#ifdef DEBUG
#include <iostream>
#endif


greeRegistry::greeRegistry()
{
	m_lasterror = Gree::Error::NONE;
}


/* private */ bool greeRegistry::setError(Gree::Error::value error, const std::string &detail) const
{
	m_lasterror = error;
	m_lasterrordetail = detail;
#ifdef DEBUG
	std::cout << "dbg: " << Gree::Error::name(error) << ": " << detail << "\n";
#endif
	return false;
}


void greeRegistry::RecordScan(const std::vector<greeScanResult> &results, const bool keepKeys)
{
	std::map<std::string, greeDevice> devices;
	for (size_t i = 0; i < results.size(); i++)
	{
		greeDevice &device = devices[results[i].mac];
		device.mac = results[i].mac;
		device.address = results[i].address;
		device.scaninfo = results[i].pack;

		if (!keepKeys)
			continue;
		std::map<std::string, greeDevice>::const_iterator previous = m_devices.find(results[i].mac);
		if (previous != m_devices.end())
			device.key = previous->second.key;
	}
	m_devices.swap(devices);

#ifdef DEBUG
	std::cout << "dbg: registry holds " << m_devices.size() << " device(s)\n";
#endif
}


std::string greeRegistry::Resolve(const std::string &target) const
{
	std::map<std::string, std::string>::const_iterator it = m_aliases.find(target);
	if (it != m_aliases.end())
		return it->second;
	return target;
}


greeDevice* greeRegistry::Get(const std::string &mac)
{
	std::map<std::string, greeDevice>::iterator it = m_devices.find(mac);
	if (it == m_devices.end())
	{
		setError(Gree::Error::NOT_FOUND, mac);
		return nullptr;
	}
	return &it->second;
}


const greeDevice* greeRegistry::Get(const std::string &mac) const
{
	std::map<std::string, greeDevice>::const_iterator it = m_devices.find(mac);
	if (it == m_devices.end())
	{
		setError(Gree::Error::NOT_FOUND, mac);
		return nullptr;
	}
	return &it->second;
}


bool greeRegistry::RecordBind(const std::string &mac, const std::string &key)
{
	greeDevice *device = Get(mac);
	if (!device)
		return false;
	device->key = key;
	return true;
}


bool greeRegistry::ForgetKey(const std::string &mac)
{
	greeDevice *device = Get(mac);
	if (!device)
		return false;
	device->key.clear();
	return true;
}


std::vector<std::string> greeRegistry::devices() const
{
	std::vector<std::string> result;
	for (std::map<std::string, greeDevice>::const_iterator it = m_devices.begin(); it != m_devices.end(); ++it)
		result.push_back(it->first);
	return result;
}
