/*
 *  Monitor thread with command input example for local Gree client
 *
 *  This example creates a looping thread that polls the device state every
 *  few seconds and writes any change to screen. Meanwhile the main thread
 *  accepts commands on the command line:
 *
 *   'NAME=VALUE' to set a variable, e.g. Pow=1 or SetTem=24
 *   'i' to print the last known state
 *   'q' to quit
 *
 *  Note: you must hit 'Enter' for the commands to actually be sent to the app
 *
 *  Both threads share one client object, every access goes through the
 *  same mutex.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */


// time in seconds between state polls
#define POLLTIME 5

// sleep time in milliseconds between checks of the stop flag
#define SLEEPTIME 100


/******************************************************************************/

#include "greeClient.hpp"
#include <unistd.h>
#include <iostream>
#include <string.h>
#include <cstdio>
#include <errno.h>
#include <json/json.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <mutex>
#include <poll.h>


std::atomic<bool> StopRequested(false);
std::mutex m_clientMutex;
greeClient *m_greeclient;
std::string m_szTarget;
Json::Value m_jLastState;


void do_something_with_state(const Json::Value &jState)
{
	// this is where data gets sent to for doing stuff
	if (jState == m_jLastState)
		return;
	m_jLastState = jState;
	Json::StreamWriterBuilder jBuilder;
	jBuilder["indentation"] = "";
	std::cout << Json::writeString(jBuilder, jState) << "\n";
}


void PollState()
{
	greeVarBag bag;
	if (!bag.FromNames(Gree::Vars::names()))
		return;

	std::lock_guard<std::mutex> lock(m_clientMutex);
	if (!m_greeclient->NetRead(m_szTarget, bag))
	{
		std::cout << "Error: read failed: " << Gree::Error::name(m_greeclient->getlasterror()) << "\n";
		return;
	}
	do_something_with_state(bag.ToReportMap());
}


void SendCommand(const std::string &szCommand)
{
	if (szCommand == "i")
	{
		std::lock_guard<std::mutex> lock(m_clientMutex);
		std::cout << m_jLastState.toStyledString();
		return;
	}

	size_t pos = szCommand.find('=');
	if (pos == std::string::npos)
	{
		if (!szCommand.empty())
			std::cout << "Error: expected NAME=VALUE\n";
		return;
	}

	greeVarBag bag;
	std::vector<std::pair<std::string, std::string> > pairs;
	pairs.push_back(std::make_pair(szCommand.substr(0, pos), szCommand.substr(pos + 1)));
	if (!bag.FromNameValuePairs(pairs))
	{
		std::cout << "Error: " << Gree::Error::name(bag.getlasterror()) << " " << bag.getlasterrordetail() << "\n";
		return;
	}

	std::lock_guard<std::mutex> lock(m_clientMutex);
	if (!m_greeclient->NetWrite(m_szTarget, bag))
		std::cout << "Error: write failed: " << Gree::Error::name(m_greeclient->getlasterror()) << "\n";
	else
		std::cout << "ok\n";
}


void DoWork()
{
	std::chrono::steady_clock::time_point next_poll = std::chrono::steady_clock::now();
	while (!StopRequested)
	{
		if (std::chrono::steady_clock::now() >= next_poll)
		{
			PollState();
			next_poll = std::chrono::steady_clock::now() + std::chrono::seconds(POLLTIME);
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(SLEEPTIME));
	}
}


int main(int argc, char *argv[])
{
	if (argc < 2) {
	   fprintf(stderr,"usage %s <mac|alias>\n", argv[0]);
	   exit(0);
	}
	m_szTarget = argv[1];

	greeConfig config;
	if (!config.LoadFile())
		config = greeConfig();
	// both threads wait on the socket through the same queue
	config.receiver_thread = true;

	m_greeclient = new greeClient();
	m_greeclient->setOutput(&std::cout);
	if (!m_greeclient->Configure(config) || !m_greeclient->Open())
	{
		std::cout << "Error: " << Gree::Error::name(m_greeclient->getlasterror()) << " " << m_greeclient->getlasterrordetail() << "\n";
		delete m_greeclient;
		exit(1);
	}

	std::thread WorkerThread(DoWork);

	std::cout << "Enter NAME=VALUE to set a variable, 'i' to show the state, 'q' to quit\n";
	std::cout << "Enter to confirm command\n\n";

	struct pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
	std::string szLine;
	while (szLine != "q")
	{
		int ret = poll(&pfd, 1, 100);  // timeout of 100ms
		if (ret == 1) // there is something to read
		{
			if (!std::getline(std::cin, szLine))
				break;
			SendCommand(szLine);
		}
		else if (ret == -1)
		{
			std::cout << "Error: " << strerror(errno) << std::endl;
		}
	}
	StopRequested = true;

	WorkerThread.join();
	delete m_greeclient;
}
