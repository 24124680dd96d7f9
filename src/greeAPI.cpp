/*
 *  Client interface for local Gree device access
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeAPI.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <set>

#ifdef DEBUG
#include <iostream>
#endif


namespace Gree {
  namespace Messages {
    static const std::string SCAN = "{\"t\":\"scan\"}";
    static const std::string CID = "app";
  }; // namespace Messages
}; // namespace Gree


greeAPI::greeAPI()
{
	m_devicePort = GREE_COMMAND_PORT;
}


/* protected */ bool greeAPI::setError(const Gree::Error::value error, const std::string &detail)
{
	m_lasterror = error;
	m_lasterrordetail = detail;
#ifdef DEBUG
	std::cout << "{\"msg\":\"" << Gree::Error::name(error) << ": " << detail << "\"}\n";
#endif
	return false;
}


/* protected */ bool greeAPI::ParseJson(const std::string &szText, Json::Value &jValue)
{
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!jReader->parse(szText.c_str(), szText.c_str() + szText.size(), &jValue, &szErrors))
		return setError(Gree::Error::SERIALIZATION, szErrors);
	return true;
}


/* protected */ std::string greeAPI::WriteJson(const Json::Value &jValue)
{
	Json::StreamWriterBuilder jBuilder;
	jBuilder["indentation"] = "";
	return Json::writeString(jBuilder, jValue);
}


std::string greeAPI::GenerateScanRequest()
{
	return Gree::Messages::SCAN;
}


Json::Value greeAPI::GenerateBindPack(const std::string &szMac)
{
	Json::Value jPack;
	jPack["mac"] = szMac;
	jPack["t"] = GREE_MSG_BIND;
	jPack["uid"] = 0;
	return jPack;
}


Json::Value greeAPI::GenerateStatusPack(const std::string &szMac, const std::vector<std::string> &names)
{
	Json::Value jPack;
	jPack["cols"] = Json::Value(Json::arrayValue);
	for (size_t i = 0; i < names.size(); i++)
		jPack["cols"].append(names[i]);
	jPack["mac"] = szMac;
	jPack["t"] = GREE_MSG_STATUS;
	return jPack;
}


Json::Value greeAPI::GenerateCommandPack(const std::vector<std::string> &names, const std::vector<Json::Value> &values)
{
	Json::Value jPack;
	jPack["opt"] = Json::Value(Json::arrayValue);
	jPack["p"] = Json::Value(Json::arrayValue);
	for (size_t i = 0; i < names.size(); i++)
		jPack["opt"].append(names[i]);
	for (size_t i = 0; i < values.size(); i++)
		jPack["p"].append(values[i]);
	jPack["t"] = GREE_MSG_CMD;
	return jPack;
}


bool greeAPI::BuildPackMessage(const Json::Value &jPack, const std::string &szEncryptionKey, const std::string &szTargetMac, const int i, std::string &datagram)
{
	std::string szPayload = WriteJson(jPack);
#ifdef DEBUG
	std::cout << "dbg: pack to encrypt: " << szPayload << "\n";
#endif

	std::string szEncodedPack;
	if (!Gree::Codec::EncodePack(szPayload, szEncryptionKey, szEncodedPack))
		return setError(Gree::Error::CRYPTO, "error encrypting pack");

	Json::Value jEnvelope;
	jEnvelope["cid"] = Gree::Messages::CID;
	jEnvelope["i"] = i;
	jEnvelope["pack"] = szEncodedPack;
	jEnvelope["t"] = GREE_MSG_PACK;
	jEnvelope["tcid"] = szTargetMac;
	jEnvelope["uid"] = 0;
	datagram = WriteJson(jEnvelope);
	return true;
}


bool greeAPI::DecodePackMessage(const std::string &datagram, const std::string &szEncryptionKey, Json::Value &jEnvelope, Json::Value &jPack)
{
	if (!ParseJson(datagram, jEnvelope))
		return false;
	if (!jEnvelope.isObject() || !jEnvelope["pack"].isString())
		return setError(Gree::Error::PROTOCOL, "message carries no pack");

	std::string szPlainText;
	if (!Gree::Codec::DecodePack(jEnvelope["pack"].asString(), szEncryptionKey, szPlainText))
		return setError(Gree::Error::CRYPTO, "error decrypting pack");

#ifdef DEBUG
	std::cout << "dbg: pack raw: " << szPlainText << "\n";
#endif

	if (!ParseJson(szPlainText, jPack))
		return false;
	if (!jPack.isObject())
		return setError(Gree::Error::PROTOCOL, "pack is not an object");
	return true;
}


bool greeAPI::ParseScanResponse(const Json::Value &jPack, greeScanResult &result)
{
	if (!jPack.isObject() || !jPack["mac"].isString() || jPack["mac"].asString().empty())
		return setError(Gree::Error::PROTOCOL, "scan reply without mac");

	result.mac = jPack["mac"].asString();
	result.pack = jPack;
	return true;
}


bool greeAPI::ParseBindResponse(const Json::Value &jPack, greeBindResponse &response)
{
	if (!jPack.isObject() || (jPack["t"].asString() != GREE_MSG_BINDOK))
		return setError(Gree::Error::PROTOCOL, "expected bindok reply");
	if (!jPack["key"].isString() || (jPack["key"].asString().length() != GREE_KEY_SIZE))
		return setError(Gree::Error::PROTOCOL, "bind reply carries no valid key");

	response.mac = jPack["mac"].isString() ? jPack["mac"].asString() : "";
	response.key = jPack["key"].asString();
	response.r = jPack["r"].isInt() ? jPack["r"].asInt() : 0;
	return true;
}


bool greeAPI::ParseStatusResponse(const Json::Value &jPack, greeStatusResponse &response)
{
	if (!jPack.isObject() || (jPack["t"].asString() != GREE_MSG_DAT))
		return setError(Gree::Error::PROTOCOL, "expected dat reply");
	if (!jPack["cols"].isArray() || !jPack["dat"].isArray())
		return setError(Gree::Error::PROTOCOL, "dat reply without cols or dat");

	response.mac = jPack["mac"].isString() ? jPack["mac"].asString() : "";
	response.r = jPack["r"].isInt() ? jPack["r"].asInt() : 0;
	response.cols.clear();
	response.dat.clear();
	for (Json::ArrayIndex i = 0; i < jPack["cols"].size(); i++)
		response.cols.push_back(jPack["cols"][i].isString() ? jPack["cols"][i].asString() : "");
	for (Json::ArrayIndex i = 0; i < jPack["dat"].size(); i++)
		response.dat.push_back(jPack["dat"][i]);
	return true;
}


bool greeAPI::ParseCommandResponse(const Json::Value &jPack, greeCommandResponse &response)
{
	if (!jPack.isObject() || (jPack["t"].asString() != GREE_MSG_RES))
		return setError(Gree::Error::PROTOCOL, "expected res reply");
	if (!jPack["opt"].isArray() || !jPack["p"].isArray())
		return setError(Gree::Error::PROTOCOL, "res reply without opt or p");

	response.mac = jPack["mac"].isString() ? jPack["mac"].asString() : "";
	response.r = jPack["r"].isInt() ? jPack["r"].asInt() : 0;
	response.opt.clear();
	response.p.clear();
	response.val.clear();
	for (Json::ArrayIndex i = 0; i < jPack["opt"].size(); i++)
		response.opt.push_back(jPack["opt"][i].isString() ? jPack["opt"][i].asString() : "");
	for (Json::ArrayIndex i = 0; i < jPack["p"].size(); i++)
		response.p.push_back(jPack["p"][i]);
	if (jPack["val"].isArray())
	{
		for (Json::ArrayIndex i = 0; i < jPack["val"].size(); i++)
			response.val.push_back(jPack["val"][i]);
	}
	return true;
}


bool greeAPI::Exchange(const std::string &address, const std::string &datagram, const std::string &szEncryptionKey,
                       const std::string &szExpectedType, const std::string &szMac, Json::Value &jPack)
{
	m_lasterrordetail.clear();

	// anything still queued belongs to an earlier, already completed request
	drain();

	if (!send(datagram, address, m_devicePort))
	{
		m_lasterrordetail = "send to " + address + " failed";
		return false;
	}

	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(getReceiveTimeout());
	std::string sender, reply;
	while (true)
	{
		int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
		if (remaining <= 0)
			return setError(Gree::Error::TIMEOUT, "no reply from " + address);

		if (!receive(sender, reply, remaining))
		{
			if (m_lasterror == Gree::Error::TIMEOUT)
				return setError(Gree::Error::TIMEOUT, "no reply from " + address);
			if (m_lasterror == Gree::Error::PROTOCOL)
			{
#ifdef DEBUG
				std::cout << "dbg: [" << sender << "] ignoring oversized datagram\n";
#endif
				continue;
			}
			m_lasterrordetail = "receive failed";
			return false;
		}

		if (sender != address)
		{
#ifdef DEBUG
			std::cout << "dbg: [" << sender << "] ignoring datagram while waiting for " << address << "\n";
#endif
			continue;
		}

		Json::Value jEnvelope;
		if (!DecodePackMessage(reply, szEncryptionKey, jEnvelope, jPack))
			return false;

		if (jPack["t"].asString() != szExpectedType)
		{
#ifdef DEBUG
			std::cout << "dbg: [" << sender << "] ignoring '" << jPack["t"].asString() << "' reply while waiting for '" << szExpectedType << "'\n";
#endif
			continue;
		}
		if (!szMac.empty() && jPack["mac"].isString() && (jPack["mac"].asString() != szMac))
		{
#ifdef DEBUG
			std::cout << "dbg: [" << sender << "] ignoring reply for " << jPack["mac"].asString() << "\n";
#endif
			continue;
		}

		m_lasterror = Gree::Error::NONE;
		return true;
	}
}


bool greeAPI::Scan(const std::string &broadcast_address, const size_t max_count, std::vector<greeScanResult> &results)
{
	m_lasterrordetail.clear();
	results.clear();

	drain();
	if (!send_broadcast(GenerateScanRequest(), broadcast_address, m_devicePort))
	{
		m_lasterrordetail = "broadcast to " + broadcast_address + " failed";
		return false;
	}

	// the whole scan listens for at most one receive timeout per expected device
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() +
		std::chrono::milliseconds((long long)getReceiveTimeout() * (long long)max_count);

	std::set<std::string> seen;
	std::string sender, reply;
	while (seen.size() < max_count)
	{
		int remaining = (int)std::min<long long>(getReceiveTimeout(),
			std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count());
		if (remaining <= 0)
			break;

		if (!receive(sender, reply, remaining))
		{
			// a silent network is how the device list ends
			if (m_lasterror == Gree::Error::TIMEOUT)
				break;
			if (m_lasterror == Gree::Error::PROTOCOL)
			{
#ifdef DEBUG
				std::cout << "dbg: [" << sender << "] ignoring oversized datagram during scan\n";
#endif
				continue;
			}
			m_lasterrordetail = "receive failed";
			return false;
		}

		Json::Value jEnvelope, jPack;
		if (!ParseJson(reply, jEnvelope) || !jEnvelope.isObject() || (jEnvelope["t"].asString() != GREE_MSG_PACK))
		{
#ifdef DEBUG
			std::cout << "dbg: [" << sender << "] ignoring non pack datagram during scan\n";
#endif
			continue;
		}

		if (!DecodePackMessage(reply, GREE_GENERIC_KEY, jEnvelope, jPack))
			return false;

		greeScanResult result;
		if (!ParseScanResponse(jPack, result))
		{
#ifdef DEBUG
			std::cout << "dbg: [" << sender << "] " << m_lasterrordetail << "\n";
#endif
			continue;
		}
		result.address = sender;
		result.envelope = jEnvelope;

		if (seen.count(result.mac))
		{
			// repeated reply, keep the latest
			for (size_t i = 0; i < results.size(); i++)
			{
				if (results[i].mac == result.mac)
					results[i] = result;
			}
			continue;
		}
		seen.insert(result.mac);
		results.push_back(result);
	}

	m_lasterror = Gree::Error::NONE;
	m_lasterrordetail.clear();
	return true;
}


bool greeAPI::Bind(const std::string &address, const std::string &szMac, greeBindResponse &response)
{
	std::string datagram;
	if (!BuildPackMessage(GenerateBindPack(szMac), GREE_GENERIC_KEY, szMac, 1, datagram))
		return false;

	Json::Value jPack;
	if (!Exchange(address, datagram, GREE_GENERIC_KEY, GREE_MSG_BINDOK, szMac, jPack))
		return false;
	return ParseBindResponse(jPack, response);
}


bool greeAPI::GetVars(const std::string &address, const std::string &szMac, const std::string &szEncryptionKey,
                      const std::vector<std::string> &names, greeStatusResponse &response)
{
	if (szEncryptionKey.empty())
		return setError(Gree::Error::NOT_BOUND, szMac);

	std::string datagram;
	if (!BuildPackMessage(GenerateStatusPack(szMac, names), szEncryptionKey, szMac, 0, datagram))
		return false;

	Json::Value jPack;
	if (!Exchange(address, datagram, szEncryptionKey, GREE_MSG_DAT, szMac, jPack))
		return false;
	return ParseStatusResponse(jPack, response);
}


bool greeAPI::SetVars(const std::string &address, const std::string &szMac, const std::string &szEncryptionKey,
                      const std::vector<std::string> &names, const std::vector<Json::Value> &values, greeCommandResponse &response)
{
	if (szEncryptionKey.empty())
		return setError(Gree::Error::NOT_BOUND, szMac);
	if (names.size() != values.size())
		return setError(Gree::Error::PROTOCOL, "names and values differ in length");

	std::string datagram;
	if (!BuildPackMessage(GenerateCommandPack(names, values), szEncryptionKey, szMac, 0, datagram))
		return false;

	Json::Value jPack;
	if (!Exchange(address, datagram, szEncryptionKey, GREE_MSG_RES, szMac, jPack))
		return false;
	return ParseCommandResponse(jPack, response);
}
