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

// Gree API Base Class

#ifndef _greeAPI
#define _greeAPI

// Gree Message Types
#define GREE_MSG_SCAN "scan"
#define GREE_MSG_DEV "dev"
#define GREE_MSG_PACK "pack"
#define GREE_MSG_BIND "bind"
#define GREE_MSG_BINDOK "bindok"
#define GREE_MSG_STATUS "status"
#define GREE_MSG_DAT "dat"
#define GREE_MSG_CMD "cmd"
#define GREE_MSG_RES "res"


#include "greeUDP.hpp"
#include "greeCodec.hpp"
#include <json/json.h>
#include <string>
#include <vector>


struct greeScanResult
{
	std::string address;
	std::string mac;
	Json::Value envelope;
	Json::Value pack;   // t, cid, bc, brand, catalog, mac, mid, model, name, lock, series, vender, ver
};

struct greeBindResponse
{
	std::string mac;
	std::string key;
	int r;
};

struct greeStatusResponse
{
	std::string mac;
	int r;
	std::vector<std::string> cols;
	std::vector<Json::Value> dat;
};

struct greeCommandResponse
{
	std::string mac;
	int r;
	std::vector<std::string> opt;
	std::vector<Json::Value> p;
	std::vector<Json::Value> val;
};


class greeAPI : public greeUDP
{
public:
	greeAPI();
	virtual ~greeAPI() {}

	void setDevicePort(const uint16_t port) { m_devicePort = port; }
	uint16_t getDevicePort() const { return m_devicePort; }

	// Message builders
	static std::string GenerateScanRequest();
	static Json::Value GenerateBindPack(const std::string &szMac);
	static Json::Value GenerateStatusPack(const std::string &szMac, const std::vector<std::string> &names);
	static Json::Value GenerateCommandPack(const std::vector<std::string> &names, const std::vector<Json::Value> &values);
	bool BuildPackMessage(const Json::Value &jPack, const std::string &szEncryptionKey, const std::string &szTargetMac, const int i, std::string &datagram);

	// Message parsers
	bool DecodePackMessage(const std::string &datagram, const std::string &szEncryptionKey, Json::Value &jEnvelope, Json::Value &jPack);
	bool ParseScanResponse(const Json::Value &jPack, greeScanResult &result);
	bool ParseBindResponse(const Json::Value &jPack, greeBindResponse &response);
	bool ParseStatusResponse(const Json::Value &jPack, greeStatusResponse &response);
	bool ParseCommandResponse(const Json::Value &jPack, greeCommandResponse &response);

	// Sends `datagram` to `address` and waits for the matching reply
	bool Exchange(const std::string &address, const std::string &datagram, const std::string &szEncryptionKey,
	              const std::string &szExpectedType, const std::string &szMac, Json::Value &jPack);

	// Device operations
	// listens for at most max_count receive timeouts in total
	bool Scan(const std::string &broadcast_address, const size_t max_count, std::vector<greeScanResult> &results);
	bool Bind(const std::string &address, const std::string &szMac, greeBindResponse &response);
	bool GetVars(const std::string &address, const std::string &szMac, const std::string &szEncryptionKey,
	             const std::vector<std::string> &names, greeStatusResponse &response);
	bool SetVars(const std::string &address, const std::string &szMac, const std::string &szEncryptionKey,
	             const std::vector<std::string> &names, const std::vector<Json::Value> &values, greeCommandResponse &response);

	const std::string &getlasterrordetail() const { return m_lasterrordetail; }

protected:
	using greeUDP::setError;
	bool setError(const Gree::Error::value error, const std::string &detail);
	bool ParseJson(const std::string &szText, Json::Value &jValue);
	std::string WriteJson(const Json::Value &jValue);

	uint16_t m_devicePort;
	std::string m_lasterrordetail;
};

#endif // _greeAPI
