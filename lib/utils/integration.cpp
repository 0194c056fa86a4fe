#include "utils/integration.hpp"
#include "models/exceptions.hpp"


namespace utils {
    GaussRule integration::gauss_rule(ElementOrder order){
        if (order == ElementOrder::Linear) {
            return gauss_legendre_01(1);
        }

        // closed form of the 3-point rule on [0,1]
        GaussRule rule;
        rule.points = (Eigen::Vector3d() <<
            (1.0 - std::sqrt(3.0/5.0)) / 2.0,
            0.5,
            (1.0 + std::sqrt(3.0/5.0)) / 2.0).finished();
        rule.weights = (Eigen::Vector3d() << 5.0/18.0, 8.0/18.0, 5.0/18.0).finished();
        return rule;
    }

    void integration::get_gauss_quadrature_rule(
        int n_points,
        std::vector<double>& points,
        std::vector<double>& weights
    ){
        points.clear();
        weights.clear();

        if (n_points == 1){
            // 1-point rule (degree of precision = 1)
            points = {0.0};
            weights = {2.0};
        } else if (n_points == 2){
            // 2-point rule (degree of precision = 3)
            points = {-1.0/std::sqrt(3.0), 1.0/std::sqrt(3.0)};
            weights = {1.0, 1.0};
        } else if (n_points == 3){
            // 3-point rule (degree of precision = 5)
            points = {-std::sqrt(3.0/5.0), 0.0, std::sqrt(3.0/5.0)};
            weights = {5.0/9.0, 8.0/9.0, 5.0/9.0};
        } else if (n_points == 4){
            // 4-point rule (degree of precision = 7)
            double sqrt_30 = std::sqrt(30.0);
            points = {-std::sqrt((3.0 + 2.0*std::sqrt(6.0/5.0))/7.0),
                  -std::sqrt((3.0 - 2.0*std::sqrt(6.0/5.0))/7.0),
                   std::sqrt((3.0 - 2.0*std::sqrt(6.0/5.0))/7.0),
                   std::sqrt((3.0 + 2.0*std::sqrt(6.0/5.0))/7.0)};
            weights = {(18.0 - sqrt_30)/36.0,
                    (18.0 + sqrt_30)/36.0,
                    (18.0 + sqrt_30)/36.0,
                    (18.0 - sqrt_30)/36.0};
        } else if (n_points == 5){
            // 5-point rule (degree of precision = 9)
            double sqrt_70 = std::sqrt(70.0);
            points = {-std::sqrt(5.0 + 2.0*std::sqrt(10.0/7.0))/3.0,
                    -std::sqrt(5.0 - 2.0*std::sqrt(10.0/7.0))/3.0,
                    0.0,
                    std::sqrt(5.0 - 2.0*std::sqrt(10.0/7.0))/3.0,
                    std::sqrt(5.0 + 2.0*std::sqrt(10.0/7.0))/3.0};
            weights = {(322.0 - 13.0*sqrt_70)/900.0,
                    (322.0 + 13.0*sqrt_70)/900.0,
                    128.0/225.0,
                    (322.0 + 13.0*sqrt_70)/900.0,
                    (322.0 - 13.0*sqrt_70)/900.0};
        } else {
            throw UnsupportedConfigurationError(
                "Gauss-Legendre rule with " + std::to_string(n_points) + " points is not available");
        }
    }

    GaussRule integration::gauss_legendre_01(int n_points){
        std::vector<double> points, weights;
        get_gauss_quadrature_rule(n_points, points, weights);

        GaussRule rule;
        rule.points.resize(n_points);
        rule.weights.resize(n_points);
        for (int i = 0; i < n_points; ++i) {
            rule.points(i) = 0.5 * (points[i] + 1.0);
            rule.weights(i) = 0.5 * weights[i];
        }
        return rule;
    }
}
