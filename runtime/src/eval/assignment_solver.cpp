#include "eval/assignment_solver.h"
#include "core/error.h"

#include <algorithm>
#include <cmath>
#include <limits>

static void check_matrix(const CostMatrix &matrix)
{
	const size_t k = matrix.size();
	for (size_t i = 0; i < k; ++i)
	{
		if (matrix[i].size() != k)
		{
			throw AssignmentError(
					"cost matrix must be square: row " + std::to_string(i) + " has " +
					std::to_string(matrix[i].size()) + " columns, expected " + std::to_string(k));
		}

		for (double value : matrix[i])
		{
			if (!std::isfinite(value))
				throw AssignmentError("cost matrix contains a non-finite entry in row " + std::to_string(i));
		}
	}
}

Assignment solve_assignment(const CostMatrix &matrix)
{
	check_matrix(matrix);

	Assignment result;
	const size_t k = matrix.size();
	if (k == 0)
		return result;

	// Maximization is solved as minimization of (max - a[i][j]).
	double max_entry = matrix[0][0];
	for (const auto &row : matrix)
		for (double value : row)
			max_entry = std::max(max_entry, value);

	auto cost = [&](size_t i, size_t j)
	{
		return max_entry - matrix[i][j];
	};

	const double inf = std::numeric_limits<double>::infinity();

	// 1-based potentials; column 0 is the virtual source.
	std::vector<double> u(k + 1, 0.0);
	std::vector<double> v(k + 1, 0.0);
	std::vector<size_t> col_owner(k + 1, 0);
	std::vector<size_t> way(k + 1, 0);

	for (size_t row = 1; row <= k; ++row)
	{
		col_owner[0] = row;
		size_t col0 = 0;
		std::vector<double> min_slack(k + 1, inf);
		std::vector<bool> used(k + 1, false);

		do
		{
			used[col0] = true;
			size_t i0 = col_owner[col0];
			double delta = inf;
			size_t col1 = 0;

			for (size_t j = 1; j <= k; ++j)
			{
				if (used[j])
					continue;

				double reduced = cost(i0 - 1, j - 1) - u[i0] - v[j];
				if (reduced < min_slack[j])
				{
					min_slack[j] = reduced;
					way[j] = col0;
				}
				if (min_slack[j] < delta)
				{
					delta = min_slack[j];
					col1 = j;
				}
			}

			if (col1 == 0)
				throw AssignmentError("no augmenting path found");

			for (size_t j = 0; j <= k; ++j)
			{
				if (used[j])
				{
					u[col_owner[j]] += delta;
					v[j] -= delta;
				}
				else
				{
					min_slack[j] -= delta;
				}
			}

			col0 = col1;
		} while (col_owner[col0] != 0);

		// augment along the alternating path
		do
		{
			size_t col1 = way[col0];
			col_owner[col0] = col_owner[col1];
			col0 = col1;
		} while (col0 != 0);
	}

	result.row_to_col.assign(k, 0);
	for (size_t j = 1; j <= k; ++j)
	{
		result.row_to_col[col_owner[j] - 1] = j - 1;
	}

	for (size_t i = 0; i < k; ++i)
		result.total += matrix[i][result.row_to_col[i]];

	return result;
}
