// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

/*****************************************************************************\
* This file is part of the gpoint library.
*
* gpoint - a compact C/C++ library that renders floating-point values exactly
* as the C runtime's printf("%g") does, without calling the C runtime.
* It was developed for experimental and educational purposes, so please keep
* expectations reasonable.
*
* Report bugs or suggest improvements to author: <programmer.amateur@proton.me>
*
* LICENSE & DISCLAIMER:
* - No warranties. Use at your own risk.
* - Licensed under Business Source License 1.1 (BSL-1.1):
*   - Free for non-commercial use.
*   - For commercial licensing, contact the author.
*   - Change Date: 2029-09-01 - after which the library will be licensed
*     under GNU GPLv3.
*   - Attribution required: "gpoint Library (c) A.Prograamar".
*   - See LICENSE in the project root for full terms.
\*****************************************************************************/

#include <gpoint/gpoint.h>

#include <array>
#include <cassert>
#include <cstdio>
#include <string_view>

using namespace std::literals;

namespace
{
#if !defined(GP_VERSION_MAJOR)
	constexpr auto GP_VERSION_MAJOR = 0;
#endif
#if !defined(GP_VERSION_MINOR)
	constexpr auto GP_VERSION_MINOR = 0;
#endif
#if !defined(GP_VERSION_PATCH)
	constexpr auto GP_VERSION_PATCH = 0;
#endif
} // namespace

GP_RESULT GP_SYS_CALL gp_SinkCb(const char *str, void *ctx)
{	if (nullptr == str)
	{	return gp_ErrInvalidArg;
	}
	auto *const stream = (nullptr == ctx) ? stdout : static_cast<std::FILE *>(ctx);
	const auto result = std::fputs(str, stream);
	assert(result >= 0);
	return result;
}

// gp_StaticInfo: Returns static information about the gpoint library based on the requested info type.
// Returns: A pointer to the requested static data (type depends on info), or nullptr if the info type is not recognized.
const void* GP_CALL gp_StaticInfo(gp_Info_e info)
{	switch (info)
	{
		case gp_InfoVer: // Returns a pointer to the version number (unsigned).
		{	static constexpr unsigned ver = (GP_VERSION_MAJOR * 1'000U + GP_VERSION_MINOR) * 10'000U + GP_VERSION_PATCH;
			return &ver;
		}

		case gp_InfoVersion: // Returns a pointer to a static string containing the full version (major.minor.patch buildType libraryType).
		{
#if GP_DEBUG
			static constexpr auto CONFIG = 'D';
#else
			static constexpr auto CONFIG = 'R';
#endif
#if GP_SHARED
			static constexpr auto TYPE = "shared"sv;
#else
			static constexpr auto TYPE = "static"sv;
#endif

			static const auto version = []
				{	static_assert(GP_VERSION_MAJOR <= 99 && GP_VERSION_MINOR <= 999 && GP_VERSION_PATCH <= 9999);
					std::array<char, "99.999.9999"sv.size() + 1U + " "sv.size() + TYPE.size() + 1U> result;
					[[maybe_unused]] const auto sz = std::snprintf
					(	result.data(),
						result.size(),
						"%u.%u.%u%c %s",
						static_cast<unsigned>(GP_VERSION_MAJOR),
						static_cast<unsigned>(GP_VERSION_MINOR),
						static_cast<unsigned>(GP_VERSION_PATCH),
						CONFIG,
						TYPE.data()
					);
					assert(0 < sz && static_cast<std::size_t>(sz) < result.size());
					return result;
				}();
			return version.data();
		}

		case gp_InfoBufferSize: // Returns a pointer to the size of the bounded output buffer (unsigned).
		{	static constexpr unsigned size = GP_BUFFER_SIZE;
			return &size;
		}

		case gp_InfoFlags:
		{	static constexpr unsigned flags = 0U
#if GP_DEBUG
				| gp_FlagDebug
#endif
#if GP_SHARED
				| gp_FlagShared
#endif
				;
			return &flags;
		}

		default: // If the info type is not recognized, assert and return nullptr.
			static_assert(gp_InfoCount_ == 4, "Not all gp_Info_e enum values are processed in the function gp_StaticInfo.");
			assert(false);
			return nullptr;
	}
}
