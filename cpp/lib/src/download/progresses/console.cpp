/**************************************************************************
*   Copyright (C) 2026 by Eugene V. Lyubimkin                             *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#include <ctime>

#include <unistd.h>
#include <fcntl.h>
#include <sys/ioctl.h>

#include <bulkfetch/download/progresses/console.hpp>

namespace bulkfetch {

typedef download::Progress::DownloadRecord DownloadRecord;
typedef download::Progress::RetryInfo RetryInfo;

namespace internal {

class ConsoleProgressImpl
{
	struct timespec previousUpdateTime;
	bool lineIsDirty;

	static void nonBlockingPrint(const string&);
	static uint16_t getTerminalWidth();
	void termClean();
	void termPrint(const string&);
 public:
	ConsoleProgressImpl();
	void print(const string&);
	void newDownload(const DownloadRecord&, const string& key, size_t totalCount);
	void transfer(const DownloadRecord&);
	void retry(const RetryInfo&);
	void finishedDownload(const string& result);
	void finish(uint64_t size, size_t time);

	bool isUpdateNeeded(bool immediate);
	void updateView(const DownloadRecord&, size_t speed);
};

ConsoleProgressImpl::ConsoleProgressImpl()
	: lineIsDirty(false)
{
	previousUpdateTime.tv_sec = 0;
	previousUpdateTime.tv_nsec = 0;
}

uint16_t ConsoleProgressImpl::getTerminalWidth()
{
	struct winsize w;
	if (!ioctl(STDERR_FILENO, TIOCGWINSZ, &w) && w.ws_col)
	{
		return w.ws_col;
	}
	else
	{
		// something went wrong with it...
		return 80;
	}
}

void ConsoleProgressImpl::nonBlockingPrint(const string& s)
{
	auto oldStatus = fcntl(STDERR_FILENO, F_GETFL);
	bool statusIsModified = false;
	if (oldStatus == -1)
	{
		warn2e(__("%s() failed"), "fcntl");
	}
	else if (fcntl(STDERR_FILENO, F_SETFL, (long)oldStatus | O_NONBLOCK) == -1)
	{
		warn2e(__("%s() failed"), "fcntl");
	}
	else
	{
		statusIsModified = true;
	}

	if (write(STDERR_FILENO, s.c_str(), s.size()) == -1)
	{
		// a progress line is not worth blocking on
	}

	if (statusIsModified)
	{
		if (fcntl(STDERR_FILENO, F_SETFL, (long)oldStatus) == -1)
		{
			warn2e(__("%s() failed"), "fcntl");
		}
	}
}

void ConsoleProgressImpl::termClean()
{
	if (lineIsDirty)
	{
		nonBlockingPrint(string("\r") + string(getTerminalWidth() - 1, ' ') + "\r");
		lineIsDirty = false;
	}
}

void ConsoleProgressImpl::termPrint(const string& s)
{
	size_t allowedWidth = getTerminalWidth() - 1;
	string outputString = "\r";
	if (s.size() > allowedWidth)
	{
		outputString += s.substr(0, allowedWidth);
	}
	else
	{
		outputString += s + string(allowedWidth - s.size(), ' ');
	}
	nonBlockingPrint(outputString);
	lineIsDirty = true;
}

void ConsoleProgressImpl::print(const string& line)
{
	termClean();
	nonBlockingPrint(line + "\n");
}

void ConsoleProgressImpl::newDownload(const DownloadRecord& record, const string& key, size_t totalCount)
{
	string counter = totalCount ?
			format2("[%zu/%zu]", record.number, totalCount) : format2("[%zu]", record.number);
	print(format2("%s %s (%s)", counter, key, humanReadableSizeString(record.size)));
}

void ConsoleProgressImpl::transfer(const DownloadRecord& record)
{
	if (record.initialOffset)
	{
		float percent = record.size ? float(record.initialOffset) * 100 / record.size : 0;
		print(format2(__("  resuming from %s (%.1f%%)"),
				humanReadableSizeString(record.initialOffset), percent));
	}
}

void ConsoleProgressImpl::retry(const RetryInfo& info)
{
	if (info.transient && !info.reachable)
	{
		print(format2(__("  network error (attempt %zu): %s; the network is unreachable, retrying in %zus"),
				info.attempt, info.reason, info.delay));
	}
	else if (info.transient)
	{
		print(format2(__("  network error (attempt %zu): %s; retrying in %zus"),
				info.attempt, info.reason, info.delay));
	}
	else if (info.attempt < info.limit)
	{
		print(format2(__("  error (%zu/%zu): %s; restarting in %zus"),
				info.attempt, info.limit, info.reason, info.delay));
	}
	else
	{
		print(format2(__("  error (%zu/%zu): %s; giving up"),
				info.attempt, info.limit, info.reason));
	}
}

void ConsoleProgressImpl::finishedDownload(const string& result)
{
	if (result.empty())
	{
		print(__("  done"));
	}
	else
	{
		print(format2(__("  failed: %s"), result));
	}
}

bool ConsoleProgressImpl::isUpdateNeeded(bool immediate)
{
	// don't print progress meter when stderr not connected to a TTY
	if (!isatty(STDERR_FILENO))
	{
		return false;
	}
	if (immediate)
	{
		return true;
	}

	struct timespec now;
	if (clock_gettime(CLOCK_MONOTONIC, &now) == -1)
	{
		return false;
	}
	auto elapsed = (now.tv_sec - previousUpdateTime.tv_sec) +
			double(now.tv_nsec - previousUpdateTime.tv_nsec) / (1000*1000*1000);
	if (elapsed < 0.5)
	{
		return false;
	}
	previousUpdateTime = now;
	return true;
}

void ConsoleProgressImpl::updateView(const DownloadRecord& record, size_t speed)
{
	string view = format2("  %.1f%% | %s / %s | %s/s",
			record.size ? float(record.downloadedSize) * 100 / record.size : 100.0,
			humanReadableSizeString(record.downloadedSize),
			humanReadableSizeString(record.size),
			humanReadableSizeString(speed));
	if (speed && record.size > record.downloadedSize)
	{
		view += string(" | ETA: ") + humanReadableDifftimeString(
				(record.size - record.downloadedSize) / speed);
	}
	termPrint(view);
}

void ConsoleProgressImpl::finish(uint64_t size, size_t time)
{
	print(format2(__("Fetched %s in %s."),
			humanReadableSizeString(size), humanReadableDifftimeString(time)));
}

}

namespace download {

ConsoleProgress::ConsoleProgress()
	: __impl(new internal::ConsoleProgressImpl)
{}

ConsoleProgress::~ConsoleProgress()
{
	delete __impl;
}

void ConsoleProgress::newDownloadHook(const string& key, const DownloadRecord& record)
{
	__impl->newDownload(record, key, getTotalCount());
}

void ConsoleProgress::transferHook(const string&, const DownloadRecord& record)
{
	__impl->transfer(record);
}

void ConsoleProgress::retryHook(const string&, const RetryInfo& info)
{
	__impl->retry(info);
}

void ConsoleProgress::finishedDownloadHook(const string&, const string& result)
{
	__impl->finishedDownload(result);
}

void ConsoleProgress::updateHook(bool immediate)
{
	const auto& records = getDownloadRecords();
	if (records.empty())
	{
		return;
	}
	const DownloadRecord& record = records.begin()->second;
	if (!record.detailed || record.downloadedSize == record.initialOffset)
	{
		return;
	}
	if (!__impl->isUpdateNeeded(immediate))
	{
		return;
	}
	__impl->updateView(record, getDownloadSpeed());
}

void ConsoleProgress::finishHook()
{
	__impl->finish(getOverallFetchedSize(), getOverallDownloadTime());
}

}
}
