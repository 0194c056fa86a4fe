#include "utils/basis.hpp"
#include "models/exceptions.hpp"

namespace utils {

    Eigen::VectorXd basis::lagrange(ElementOrder order, double c){
        if (order == ElementOrder::Linear) {
            return (Eigen::Vector2d() << 1.0 - c, c).finished();
        }
        return (Eigen::Vector3d() <<
            2.0 * c * c - 3.0 * c + 1.0,
            -4.0 * c * c + 4.0 * c,
            2.0 * c * c - c).finished();
    }

    Eigen::VectorXd basis::lagrange_derivative(ElementOrder order, double c){
        if (order == ElementOrder::Linear) {
            return (Eigen::Vector2d() << -1.0, 1.0).finished();
        }
        return (Eigen::Vector3d() <<
            4.0 * c - 3.0,
            -8.0 * c + 4.0,
            4.0 * c - 1.0).finished();
    }

    int basis::size() const {
        int n = (order_ == ElementOrder::Linear) ? 2 : 3;
        return dimension_ == MeshDimension::OneD ? n : n * n;
    }

    BasisFunctionSet basis::evaluate(double ksi) const {
        if (dimension_ == MeshDimension::TwoD) {
            throw ConfigurationError("Eta coordinate is required for 2D elements");
        }

        BasisFunctionSet set;
        set.values = lagrange(order_, ksi);
        set.deriv_ksi = lagrange_derivative(order_, ksi);
        return set;
    }

    BasisFunctionSet basis::evaluate(double ksi, double eta) const {
        if (dimension_ == MeshDimension::OneD) {
            throw ConfigurationError("1D elements take a single natural coordinate");
        }

        const Eigen::VectorXd f = lagrange(order_, ksi);
        const Eigen::VectorXd df = lagrange_derivative(order_, ksi);
        const Eigen::VectorXd g = lagrange(order_, eta);
        const Eigen::VectorXd dg = lagrange_derivative(order_, eta);

        const int n = static_cast<int>(f.size());

        BasisFunctionSet set;
        set.values.resize(n * n);
        set.deriv_ksi.resize(n * n);
        set.deriv_eta.resize(n * n);

        // local index = n*a + b (a along ksi, b along eta)
        for (int a = 0; a < n; ++a) {
            for (int b = 0; b < n; ++b) {
                const int local = n * a + b;
                set.values(local) = f(a) * g(b);
                set.deriv_ksi(local) = df(a) * g(b);
                set.deriv_eta(local) = f(a) * dg(b);
            }
        }

        return set;
    }
}
