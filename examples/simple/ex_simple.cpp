#include <gpoint/gpoint.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>

int main()
{	using gpoint::g;

	// The C API: the default sink writes to stdout.
	const gp_Directives_t dirs{ gp_Width | gp_Precision | gp_ForceSign, 12U, 4U };
	for (const auto v : { 0.0, 1.0 / 3.0, 6.02214076e23, -1.602176634e-19, HUGE_VAL, std::numeric_limits<double>::quiet_NaN() })
	{	if (GP_FAILED(gp_FormatGCb(v, &dirs, gp_SinkCb)) || GP_FAILED(gp_SinkCb("\n")))
		{	return 1;
		}
	}

	// The C++ wrappers follow the stream state.
	const double pi = std::acos(-1.0);
	std::cout << "pi=" << g(pi) << '\n';
	std::cout << "pi=" << std::setprecision(12) << std::setw(16) << std::setfill('0') << g(pi) << '\n';
	std::cout << "pi=" << std::left << std::showpoint << std::setprecision(3) << std::setw(8) << g(3.0F) << "|\n";

	if (const auto str = gpoint::to_string(1e100))
	{	std::cout << *str << std::endl;
	}

	std::cout << "Version: " << static_cast<const char *>(gp_StaticInfo(gp_InfoVersion)) << std::endl;
}
