/*
 *  Client interface for local Gree device access
 *
 *  This is the session orchestrator. It owns the device registry and
 *  decides when the network must be scanned again and when a device must
 *  be bound again, so callers can address devices by MAC or alias without
 *  managing sessions themselves.
 *
 *  Public operations:
 *   - Scan()
 *	Scans the network unconditionally and rebuilds the registry
 *   - Bind(target)
 *	Makes sure `target` holds a session key
 *   - NetRead(target, bag)
 *	Reads every variable in `bag` that is waiting for a read, in a single
 *	status exchange
 *   - NetWrite(target, bag)
 *	Writes every variable in `bag` that is waiting for a write, in a single
 *	command exchange. The values echoed by the device replace the local ones.
 *   - WithDevice(target, projector)
 *	Calls `projector` with the registry entry of `target`
 *   - WithState(projector)
 *	Calls `projector` with the registry
 *
 *  Bind, NetRead, NetWrite and WithDevice refresh a stale registry first and
 *  retry once after a forced rescan when the first attempt fails.
 *
 *  The class is not thread safe. Callers sharing one instance between
 *  threads must serialise access through a single mutex.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeClient
#define _greeClient

#include "greeAPI.hpp"
#include "greeConfig.hpp"
#include "greeRegistry.hpp"
#include "greeVars.hpp"
#include <functional>
#include <memory>
#include <ostream>
#include <string>


namespace Gree {
  namespace Client {
    namespace Operation {
      enum value {
        BIND,
        NET_READ,
        NET_WRITE
      }; // enum value
    }; // namespace Operation
  }; // namespace Client
}; // namespace Gree


class greeClient
{
public:
	// Without `api` the client creates and owns its transport. An injected
	// transport must outlive the client.
	explicit greeClient(greeAPI *api = nullptr);
	virtual ~greeClient();

	bool Configure(const greeConfig &config);
	const greeConfig &getConfig() const { return m_config; }

	// Opens the transport on the configured local address and port
	bool Open();
	void Close();

	// Operational messages go here, nothing is written when unset
	void setOutput(std::ostream *out) { m_out = out; }

	bool Scan();
	bool Bind(const std::string &target);
	bool NetRead(const std::string &target, greeVarBag &bag);
	bool NetWrite(const std::string &target, greeVarBag &bag);
	bool WithDevice(const std::string &target, const std::function<void(const greeDevice&)> &projector);
	bool WithState(const std::function<void(const greeRegistry&)> &projector);
	bool Execute(const std::string &target, const Gree::Client::Operation::value operation, greeVarBag *bag = nullptr);

	// Scan state machine
	bool MaybeScan(const bool force);
	bool EnsureBound(const std::string &mac);
	bool Apply(const std::string &target, const Gree::Client::Operation::value operation, greeVarBag *bag);
	bool ApplyWithRetry(const std::string &target, const Gree::Client::Operation::value operation, greeVarBag *bag);

	bool hasScanned() const { return m_hasScanned; }
	long long getLastScanTime() const { return m_lastScanTime; }

	greeRegistry &getRegistry() { return m_registry; }
	const greeRegistry &getRegistry() const { return m_registry; }
	greeAPI *getAPI() { return m_api; }

	Gree::Error::value getlasterror() const { return m_lasterror; }
	const std::string &getlasterrordetail() const { return m_lasterrordetail; }

protected:
	// Milliseconds on a monotonic clock
	virtual long long GetMonotonicMs();

	bool setError(const Gree::Error::value error, const std::string &detail);
	bool setErrorFromAPI();
	bool setErrorFromRegistry();

private:
	bool DoScan();
	bool NetReadDevice(const greeDevice &device, greeVarBag &bag);
	bool NetWriteDevice(const greeDevice &device, greeVarBag &bag);

	std::unique_ptr<greeAPI> m_ownedApi;
	greeAPI *m_api;
	greeConfig m_config;
	greeRegistry m_registry;
	std::ostream *m_out;

	bool m_hasScanned;
	long long m_lastScanTime;

	Gree::Error::value m_lasterror;
	std::string m_lasterrordetail;
};

#endif // _greeClient
