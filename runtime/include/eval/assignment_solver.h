#pragma once

#include <vector>
#include "eval/cost_matrix.h"

struct Assignment
{
	// row_to_col[i] is the column paired with row i.
	std::vector<size_t> row_to_col;
	double total = 0.0;
};

// Maximum-weight perfect matching on a square matrix (Hungarian method with
// potentials, O(k^3)). Throws AssignmentError on a ragged or non-square
// matrix or a non-finite entry.
Assignment solve_assignment(const CostMatrix &matrix);
