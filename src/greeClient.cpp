/*
 *  Client interface for local Gree device access
 *
 *  Session orchestrator
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeClient.hpp"
#include <algorithm>
#include <time.h>

#ifdef DEBUG
#include <iostream>
#endif


greeClient::greeClient(greeAPI *api)
{
	if (api)
		m_api = api;
	else
	{
		m_ownedApi.reset(new greeAPI());
		m_api = m_ownedApi.get();
	}
	m_out = nullptr;
	m_hasScanned = false;
	m_lastScanTime = 0;
	m_lasterror = Gree::Error::NONE;

	m_registry.setAliases(m_config.aliases);
	m_api->setDevicePort(m_config.device_port);
	m_api->setReceiveTimeout(m_config.timeout_ms);
}


greeClient::~greeClient()
{
	if (m_ownedApi)
		m_ownedApi->Close();
}


/* protected */ long long greeClient::GetMonotonicMs()
{
	struct timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);
	return (long long)now.tv_sec * 1000 + now.tv_nsec / 1000000;
}


/* protected */ bool greeClient::setError(const Gree::Error::value error, const std::string &detail)
{
	m_lasterror = error;
	m_lasterrordetail = detail;
#ifdef DEBUG
	std::cout << "dbg: " << Gree::Error::name(error) << ": " << detail << "\n";
#endif
	return false;
}


/* protected */ bool greeClient::setErrorFromAPI()
{
	return setError(m_api->getlasterror(), m_api->getlasterrordetail());
}


/* protected */ bool greeClient::setErrorFromRegistry()
{
	return setError(m_registry.getlasterror(), m_registry.getlasterrordetail());
}


bool greeClient::Configure(const greeConfig &config)
{
	greeConfig candidate = config;
	if (!candidate.isValid())
		return setError(Gree::Error::CONFIG, candidate.getlasterrordetail());

	m_config = candidate;
	m_registry.setAliases(m_config.aliases);
	m_api->setDevicePort(m_config.device_port);
	m_api->setReceiveTimeout(m_config.timeout_ms);
	return true;
}


bool greeClient::Open()
{
	if (!m_api->Open(m_config.bind_address, m_config.local_port))
		return setError(m_api->getlasterror(), "cannot bind " + m_config.bind_address + ":" + std::to_string(m_config.local_port));
	if (m_config.receiver_thread && !m_api->setReceiverThread(true))
		return setError(m_api->getlasterror(), "cannot start receiver thread");
	return true;
}


void greeClient::Close()
{
	m_api->Close();
}


/* private */ bool greeClient::DoScan()
{
	if (m_out)
		*m_out << "Scanning " << m_config.broadcast_address << "...\n";

	std::vector<greeScanResult> results;
	if (!m_api->Scan(m_config.broadcast_address, (size_t)m_config.max_count, results))
		return setErrorFromAPI();

	m_registry.RecordScan(results, m_config.keep_keys);
	m_lastScanTime = GetMonotonicMs();
	m_hasScanned = true;

	if (m_out)
	{
		*m_out << "Found " << results.size() << " device(s)\n";
		for (size_t i = 0; i < results.size(); i++)
			*m_out << "  " << results[i].mac << " at " << results[i].address << "\n";
	}
	return true;
}


bool greeClient::MaybeScan(const bool force)
{
	if (m_hasScanned)
	{
		long long age = GetMonotonicMs() - m_lastScanTime;
		bool expired = (age >= m_config.max_scan_age * 1000);
		bool refreshable = (age >= m_config.min_scan_age * 1000);
		if (!expired && !(refreshable && force))
		{
#ifdef DEBUG
			std::cout << "dbg: skipping scan, registry is " << age << "ms old\n";
#endif
			return true;
		}
	}
	return DoScan();
}


bool greeClient::EnsureBound(const std::string &mac)
{
	greeDevice *device = m_registry.Get(mac);
	if (!device)
		return setErrorFromRegistry();
	if (device->isBound())
		return true;

	greeBindResponse response;
	if (!m_api->Bind(device->address, mac, response))
		return setErrorFromAPI();

	// the registry may have been rebuilt while waiting for the reply
	if (!m_registry.RecordBind(mac, response.key))
		return setErrorFromRegistry();

	if (m_out)
		*m_out << "Bound " << mac << "\n";
	return true;
}


/* private */ bool greeClient::NetReadDevice(const greeDevice &device, greeVarBag &bag)
{
	std::vector<std::string> names = bag.PendingReads();
	if (names.empty())
		return true;

	greeStatusResponse response;
	if (!m_api->GetVars(device.address, device.mac, device.key, names, response))
	{
		// a rebooted device issues a new key, bind again on the next attempt
		setErrorFromAPI();
		m_registry.ForgetKey(device.mac);
		return false;
	}

	size_t count = std::min(response.cols.size(), response.dat.size());
	for (size_t i = 0; i < count; i++)
		bag.ApplyReadResult(response.cols[i], response.dat[i]);
	return true;
}


/* private */ bool greeClient::NetWriteDevice(const greeDevice &device, greeVarBag &bag)
{
	std::vector<std::pair<std::string, Json::Value> > writes = bag.PendingWrites();
	if (writes.empty())
		return true;

	std::vector<std::string> names;
	std::vector<Json::Value> values;
	for (size_t i = 0; i < writes.size(); i++)
	{
		names.push_back(writes[i].first);
		values.push_back(writes[i].second);
	}

	greeCommandResponse response;
	if (!m_api->SetVars(device.address, device.mac, device.key, names, values, response))
	{
		setErrorFromAPI();
		m_registry.ForgetKey(device.mac);
		return false;
	}

	// the device is authoritative: take the echoed values, not ours
	size_t count = std::min(response.opt.size(), response.p.size());
	for (size_t i = 0; i < count; i++)
		bag.ApplyWriteResult(response.opt[i], response.p[i]);
	return true;
}


bool greeClient::Apply(const std::string &target, const Gree::Client::Operation::value operation, greeVarBag *bag)
{
	if ((operation != Gree::Client::Operation::BIND) && !bag)
		return setError(Gree::Error::INVALID_VARIABLE, "no variable bag");

	std::string mac = m_registry.Resolve(target);
	if (!EnsureBound(mac))
		return false;

	const greeDevice *device = m_registry.Get(mac);
	if (!device)
		return setErrorFromRegistry();

	switch (operation)
	{
		case Gree::Client::Operation::NET_READ:
			return NetReadDevice(*device, *bag);
		case Gree::Client::Operation::NET_WRITE:
			return NetWriteDevice(*device, *bag);
		case Gree::Client::Operation::BIND:
		default:
			return true;
	}
}


bool greeClient::ApplyWithRetry(const std::string &target, const Gree::Client::Operation::value operation, greeVarBag *bag)
{
	if (!MaybeScan(false))
		return false;
	if (Apply(target, operation, bag))
		return true;

#ifdef DEBUG
	std::cout << "dbg: " << target << ": first attempt failed (" << Gree::Error::name(m_lasterror) << "), retrying\n";
#endif
	if (!MaybeScan(true))
		return false;
	return Apply(target, operation, bag);
}


bool greeClient::Scan()
{
	return DoScan();
}


bool greeClient::Bind(const std::string &target)
{
	return ApplyWithRetry(target, Gree::Client::Operation::BIND, nullptr);
}


bool greeClient::NetRead(const std::string &target, greeVarBag &bag)
{
	return ApplyWithRetry(target, Gree::Client::Operation::NET_READ, &bag);
}


bool greeClient::NetWrite(const std::string &target, greeVarBag &bag)
{
	return ApplyWithRetry(target, Gree::Client::Operation::NET_WRITE, &bag);
}


bool greeClient::Execute(const std::string &target, const Gree::Client::Operation::value operation, greeVarBag *bag)
{
	return ApplyWithRetry(target, operation, bag);
}


bool greeClient::WithDevice(const std::string &target, const std::function<void(const greeDevice&)> &projector)
{
	if (!MaybeScan(false))
		return false;

	std::string mac = m_registry.Resolve(target);
	const greeDevice *device = m_registry.Get(mac);
	if (!device)
	{
		if (!MaybeScan(true))
			return false;
		device = m_registry.Get(mac);
		if (!device)
			return setErrorFromRegistry();
	}

	projector(*device);
	return true;
}


bool greeClient::WithState(const std::function<void(const greeRegistry&)> &projector)
{
	if (!MaybeScan(false))
		return false;
	projector(m_registry);
	return true;
}
