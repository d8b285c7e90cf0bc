// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Init.hxx"
#include "Global.hxx"
#include "Error.hxx"

#include <mutex>

static std::mutex curl_init_mutex;
static unsigned curl_init_ref;

static void
CurlGlobalInit()
{
	const std::scoped_lock lock{curl_init_mutex};

	if (curl_init_ref == 0) {
		CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
		if (code != CURLE_OK)
			throw CurlError(code, "curl_global_init() failed");
	}

	++curl_init_ref;
}

static void
CurlGlobalDeinit() noexcept
{
	const std::scoped_lock lock{curl_init_mutex};

	if (--curl_init_ref == 0)
		curl_global_cleanup();
}

CurlInit::CurlInit(EventLoop &event_loop)
{
	CurlGlobalInit();

	try {
		instance = std::make_unique<CurlGlobal>(event_loop);
	} catch (...) {
		CurlGlobalDeinit();
		throw;
	}
}

CurlInit::~CurlInit() noexcept
{
	instance.reset();
	CurlGlobalDeinit();
}
