// -*- LSST-C++ -*-
/*
 * LSST Data Management System
 *
 * This product includes software developed by the
 * LSST Project (http://www.lsst.org/).
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the LSST License Statement and
 * the GNU General Public License along with this program.  If not,
 * see <http://www.lsstcorp.org/LegalNotices/>.
 */
#ifndef LSST_SQLRW_PRESTO_OPERATORRULES_H
#define LSST_SQLRW_PRESTO_OPERATORRULES_H

namespace lsst::sqlrw::rewrite {
class Stage;
}

namespace lsst::sqlrw::presto {

/// Register the operator rules on the stage: the regular expression match operators
/// (`a RLIKE p`, `a REGEXP p`) become `regexp_like(a, p)` and `a % b` becomes `mod(a, b)`.
void addOperatorRules(rewrite::Stage& stage);

}  // namespace lsst::sqlrw::presto

#endif  // LSST_SQLRW_PRESTO_OPERATORRULES_H
