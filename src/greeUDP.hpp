/*
 *	Client interface for local Gree device access
 *
 *	This is the base UDP communication class. A single socket serves every
 *	device on the network: requests are sent unicast (or broadcast for scans)
 *	to port 7000 and replies are attributed by their sender address.
 *
 *	Two receive strategies are supported:
 *	 - blocking mode (default)
 *		receive() polls the socket itself, bounded by the receive timeout.
 *	 - receiver thread
 *		a background thread drains the socket into a queue and receive()
 *		waits on that queue, bounded by the receive timeout.
 *
 *	Common functions:
 *	 - Open(bind_address, port)
 *		Creates the socket and binds it to the local address. Port 0 picks
 *		an ephemeral port.
 *		Returns true|false indicating success or failure
 *	 - send(datagram, address, port)
 *		Sends a unicast datagram
 *		Returns true|false
 *	 - send_broadcast(datagram, address, port)
 *		Same, with SO_BROADCAST enabled
 *	 - receive(sender, datagram, timeout)
 *		Waits at most `timeout` milliseconds (-1 uses the configured receive
 *		timeout) for the next datagram and reports its sender address.
 *		Returns false with getlasterror() == Gree::Error::TIMEOUT on expiry
 *		and Gree::Error::PROTOCOL for a datagram larger than
 *		GREE_MAX_DATAGRAM_SIZE, which is consumed without being delivered
 *	 - drain()
 *		Discards everything received so far. Called before every exchange so
 *		a late reply to an earlier request can not be mistaken for the answer
 *		to the next one.
 *	 - Close()
 *		Stops the receiver thread and closes the socket
 *	 - getlasterror() / getlasterrno()
 *		Use these instead of referencing `errno`, which may be polluted
 *
 *	Receiver thread functions:
 *	 - setReceiverThread(true|false)
 *		Starts or stops the background receiver. Requires an open socket.
 *		Returns true|false
 *
 *
 *	Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeUDP
#define _greeUDP

// Gree Local Access UDP Port
#define GREE_COMMAND_PORT 7000

#define GREE_DEFAULT_RECEIVE_TIMEOUT_MS 3000
#define GREE_MAX_DATAGRAM_SIZE 2048

#include "greeErrors.hpp"
#include <string>
#include <cstdint>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>


namespace Gree {
  namespace UDP {
    namespace Socket {
      enum value {
        CLOSED,
        NO_SOCK_AVAIL,
        FAILED,
        OPEN,
        RECEIVING
      }; // enum value
    }; // namespace Socket
  }; // namespace UDP
}; // namespace Gree


class greeUDP
{

public:
	greeUDP();
	virtual ~greeUDP();

	virtual bool Open(const std::string &bind_address = "0.0.0.0", const uint16_t port = 0);
	virtual void Close();
	Gree::UDP::Socket::value getSocketState() const { return m_socketState; }
	uint16_t getLocalPort() const;

	void setReceiveTimeout(const int milliseconds) { m_receiveTimeout = milliseconds; }
	int getReceiveTimeout() const { return m_receiveTimeout; }
	bool setReceiverThread(bool enable = true);
	bool hasReceiverThread() const { return m_receiverThread.joinable(); }

	virtual bool send(const std::string &datagram, const std::string &address, const uint16_t port);
	virtual bool send_broadcast(const std::string &datagram, const std::string &address, const uint16_t port);
	virtual bool receive(std::string &sender, std::string &datagram, const int timeout = -1);
	virtual void drain();

	Gree::Error::value getlasterror() const { return m_lasterror; }
	int getlasterrno() const { return m_lasterrno; }

protected:
	bool setError(const Gree::Error::value error, const int sockerr = 0);

	Gree::UDP::Socket::value m_socketState;
	Gree::Error::value m_lasterror;
	int m_lasterrno;

private:
	struct Datagram
	{
		std::string sender;
		std::string payload;
		bool oversized;
	};

	bool sendto(const std::string &datagram, const std::string &address, const uint16_t port, const bool broadcast);
	bool readDatagram(std::string &sender, std::string &datagram, int &sockerr);
	int getSocketEvents(const short events, const int timeout);
	void ReceiverLoop();

	int m_sockfd;
	int m_receiveTimeout;

	std::thread m_receiverThread;
	std::atomic<bool> m_stopRequested;
	std::mutex m_queueMutex;
	std::condition_variable m_queueCondition;
	std::deque<Datagram> m_queue;
	bool m_receiverFailed;
};

#endif // _greeUDP
