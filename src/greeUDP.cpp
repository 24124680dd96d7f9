/*
 *	Client interface for local Gree device access
 *
 *	This is the base UDP communication class. See greeUDP.hpp for an
 *	overview of the available functions.
 *
 *
 *	Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#define RECEIVER_POLL_INTERVAL_MS 100

#include "greeUDP.hpp"
#include <unistd.h>
#include <cstring>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>

#ifdef DEBUG
#include <iostream>
#endif


greeUDP::greeUDP()
{
	m_sockfd = -1;
	m_socketState = Gree::UDP::Socket::CLOSED;
	m_lasterror = Gree::Error::NONE;
	m_lasterrno = 0;
	m_receiveTimeout = GREE_DEFAULT_RECEIVE_TIMEOUT_MS;
	m_stopRequested = false;
	m_receiverFailed = false;
}


greeUDP::~greeUDP()
{
	Close();
}


/* protected */ bool greeUDP::setError(const Gree::Error::value error, const int sockerr)
{
	m_lasterror = error;
	m_lasterrno = sockerr;
#ifdef DEBUG
	std::cout << "{\"msg\":\"" << Gree::Error::name(error);
	if (sockerr)
		std::cout << ": " << strerror(sockerr);
	std::cout << "\",\"code\":" << sockerr << "}\n";
#endif
	return false;
}


bool greeUDP::Open(const std::string &bind_address, const uint16_t port)
{
	if (m_sockfd >= 0)
		Close();

	struct sockaddr_in local_addr;
	memset(&local_addr, 0, sizeof(local_addr));
	local_addr.sin_family = AF_INET;
	local_addr.sin_port = htons(port);
	if (inet_pton(AF_INET, bind_address.c_str(), &local_addr.sin_addr) != 1)
	{
		m_socketState = Gree::UDP::Socket::FAILED;
		return setError(Gree::Error::IO, EINVAL);
	}

	m_sockfd = socket(AF_INET, SOCK_DGRAM, 0);
	if (m_sockfd < 0)
	{
		m_socketState = Gree::UDP::Socket::NO_SOCK_AVAIL;
		return setError(Gree::Error::IO, errno);
	}

	int set = 1;
	setsockopt(m_sockfd, SOL_SOCKET, SO_REUSEADDR, &set, sizeof(set));

	if (bind(m_sockfd, (const sockaddr*)&local_addr, sizeof(local_addr)) != 0)
	{
		int sockerr = errno;
		close(m_sockfd);
		m_sockfd = -1;
		m_socketState = Gree::UDP::Socket::FAILED;
		return setError(Gree::Error::IO, sockerr);
	}

	m_socketState = Gree::UDP::Socket::OPEN;
	m_lasterror = Gree::Error::NONE;
	m_lasterrno = 0;
	return true;
}


void greeUDP::Close()
{
	setReceiverThread(false);
	if (m_sockfd >= 0)
		close(m_sockfd);
	m_sockfd = -1;
	m_socketState = Gree::UDP::Socket::CLOSED;
}


uint16_t greeUDP::getLocalPort() const
{
	if (m_sockfd < 0)
		return 0;
	struct sockaddr_in local_addr;
	socklen_t len = sizeof(local_addr);
	if (getsockname(m_sockfd, (sockaddr*)&local_addr, &len) != 0)
		return 0;
	return ntohs(local_addr.sin_port);
}


bool greeUDP::setReceiverThread(bool enable)
{
	if (!enable)
	{
		if (m_receiverThread.joinable())
		{
			m_stopRequested = true;
			m_receiverThread.join();
			std::lock_guard<std::mutex> lock(m_queueMutex);
			m_queue.clear();
		}
		if (m_socketState == Gree::UDP::Socket::RECEIVING)
			m_socketState = Gree::UDP::Socket::OPEN;
		return true;
	}

	if (m_sockfd < 0)
		return setError(Gree::Error::IO, EBADF);
	if (m_receiverThread.joinable())
		return true;

	m_stopRequested = false;
	m_receiverFailed = false;
	m_receiverThread = std::thread(&greeUDP::ReceiverLoop, this);
	m_socketState = Gree::UDP::Socket::RECEIVING;
	return true;
}


bool greeUDP::send(const std::string &datagram, const std::string &address, const uint16_t port)
{
	return sendto(datagram, address, port, false);
}


bool greeUDP::send_broadcast(const std::string &datagram, const std::string &address, const uint16_t port)
{
	return sendto(datagram, address, port, true);
}


/* private */ bool greeUDP::sendto(const std::string &datagram, const std::string &address, const uint16_t port, const bool broadcast)
{
	if (m_sockfd < 0)
		return setError(Gree::Error::IO, EBADF);

	struct sockaddr_in peer_addr;
	memset(&peer_addr, 0, sizeof(peer_addr));
	peer_addr.sin_family = AF_INET;
	peer_addr.sin_port = htons(port);
	if (inet_pton(AF_INET, address.c_str(), &peer_addr.sin_addr) != 1)
		return setError(Gree::Error::IO, EINVAL);

	int set = broadcast ? 1 : 0;
	if (setsockopt(m_sockfd, SOL_SOCKET, SO_BROADCAST, &set, sizeof(set)) != 0)
		return setError(Gree::Error::IO, errno);

#ifdef DEBUG
	std::cout << "dbg: [" << address << ":" << port << "] send: " << datagram << "\n";
#endif

	ssize_t numbytes = ::sendto(m_sockfd, datagram.c_str(), datagram.length(), 0, (const sockaddr*)&peer_addr, sizeof(peer_addr));
	if (numbytes < 0)
		return setError(Gree::Error::IO, errno);
	if (numbytes != (ssize_t)datagram.length())
		return setError(Gree::Error::IO, EMSGSIZE);

	m_lasterror = Gree::Error::NONE;
	return true;
}


bool greeUDP::receive(std::string &sender, std::string &datagram, const int timeout)
{
	int wait = (timeout < 0) ? m_receiveTimeout : timeout;

	if (m_receiverThread.joinable())
	{
		std::unique_lock<std::mutex> lock(m_queueMutex);
		m_queueCondition.wait_for(lock, std::chrono::milliseconds(wait), [this] { return (!m_queue.empty() || m_receiverFailed); });
		if (!m_queue.empty())
		{
			sender = m_queue.front().sender;
			datagram = m_queue.front().payload;
			bool oversized = m_queue.front().oversized;
			m_queue.pop_front();
			if (oversized)
				return setError(Gree::Error::PROTOCOL, EMSGSIZE);
			m_lasterror = Gree::Error::NONE;
			return true;
		}
		if (m_receiverFailed)
			return setError(Gree::Error::IO, EPIPE);
		return setError(Gree::Error::TIMEOUT);
	}

	if (m_sockfd < 0)
		return setError(Gree::Error::IO, EBADF);

	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait);
	while (true)
	{
		int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
		if (remaining < 0)
			remaining = 0;

		int result = getSocketEvents(POLLIN, remaining);
		if (result == 0)
		{
			int sockerr = 0;
			if (readDatagram(sender, datagram, sockerr))
			{
				m_lasterror = Gree::Error::NONE;
				return true;
			}
			if (sockerr == EMSGSIZE)
				return setError(Gree::Error::PROTOCOL, sockerr);
			if ((sockerr != EAGAIN) && (sockerr != EWOULDBLOCK) && (sockerr != EINTR))
				return setError(Gree::Error::IO, sockerr);
		}
		else if (result < 0)
		{
			if (errno != EINTR)
				return setError(Gree::Error::IO, errno);
		}

		if (std::chrono::steady_clock::now() >= deadline)
			return setError(Gree::Error::TIMEOUT);
	}
}


void greeUDP::drain()
{
	if (m_receiverThread.joinable())
	{
		std::lock_guard<std::mutex> lock(m_queueMutex);
#ifdef DEBUG
		if (!m_queue.empty())
			std::cout << "dbg: discarding " << m_queue.size() << " stale datagram(s)\n";
#endif
		m_queue.clear();
		return;
	}

	if (m_sockfd < 0)
		return;

	std::string sender, datagram;
	int sockerr = 0;
	while (getSocketEvents(POLLIN, 0) == 0)
	{
		if (!readDatagram(sender, datagram, sockerr))
		{
			if (sockerr == EMSGSIZE)
				continue;
			break;
		}
#ifdef DEBUG
		std::cout << "dbg: [" << sender << "] discarding stale datagram\n";
#endif
	}
}


/* private */ bool greeUDP::readDatagram(std::string &sender, std::string &datagram, int &sockerr)
{
	unsigned char buffer[GREE_MAX_DATAGRAM_SIZE];
	struct sockaddr_in peer_addr;
	socklen_t len = sizeof(peer_addr);

	// MSG_TRUNC makes recvfrom report the real length of an oversized datagram
	ssize_t numbytes = recvfrom(m_sockfd, buffer, sizeof(buffer), MSG_DONTWAIT | MSG_TRUNC, (sockaddr*)&peer_addr, &len);
	if (numbytes < 0)
	{
		sockerr = errno;
		return false;
	}

	char cAddress[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &peer_addr.sin_addr, cAddress, sizeof(cAddress)) == nullptr)
	{
		sockerr = errno;
		return false;
	}

	sender = cAddress;
	if ((size_t)numbytes > sizeof(buffer))
	{
#ifdef DEBUG
		std::cout << "dbg: [" << sender << "] dropping oversized datagram of " << numbytes << " bytes\n";
#endif
		datagram.clear();
		sockerr = EMSGSIZE;
		return false;
	}
	datagram.assign((char*)buffer, numbytes);
#ifdef DEBUG
	std::cout << "dbg: [" << sender << "] raw: " << datagram << "\n";
#endif
	return true;
}


// Returns 0 when `events` are signalled, 1 when the timeout expired and -1 on error
/* private */ int greeUDP::getSocketEvents(const short events, const int timeout)
{
	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeout);
	if (result < 0)
		return -1;
	if (result == 0)
		return 1;
	if (fds.revents & (POLLERR | POLLNVAL))
	{
		int sockerr = 0;
		socklen_t len = sizeof sockerr;
		getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len);
		errno = (sockerr > 0) ? sockerr : EIO;
		return -1;
	}
	if (fds.revents & events)
		return 0;
	return 1;
}


/* private */ void greeUDP::ReceiverLoop()
{
	std::string sender, datagram;
	while (!m_stopRequested)
	{
		int result = getSocketEvents(POLLIN, RECEIVER_POLL_INTERVAL_MS);
		if (result == 1)
			continue;

		int sockerr = 0;
		bool received = (result == 0) && readDatagram(sender, datagram, sockerr);
		if (received || (sockerr == EMSGSIZE))
		{
			std::lock_guard<std::mutex> lock(m_queueMutex);
			Datagram entry;
			entry.sender = sender;
			entry.payload = datagram;
			entry.oversized = !received;
			m_queue.push_back(entry);
			m_queueCondition.notify_one();
			continue;
		}

		if (result < 0)
			sockerr = errno;
		if ((sockerr == EAGAIN) || (sockerr == EWOULDBLOCK) || (sockerr == EINTR))
			continue;

#ifdef DEBUG
		std::cout << "dbg: receiver stopped: " << strerror(sockerr) << "\n";
#endif
		std::lock_guard<std::mutex> lock(m_queueMutex);
		m_receiverFailed = true;
		m_queueCondition.notify_all();
		break;
	}
}
