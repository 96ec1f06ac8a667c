#include "core/config_loader.hpp"
#include "core/simulation_adapter.hpp"
#include "transport/contact.hpp"
#include <iomanip>
#include <iostream>

using namespace bmc_2d;

int main(int argc, char* argv[]) {
    std::string config_file = "config/square_device.ini";

    // Allow command-line override
    if (argc > 1) {
        config_file = argv[1];
    }

    std::cout << "Loading configuration from: " << config_file << std::endl;

    try {
        auto config = load_simulation_config(config_file);
        config.validate();
        print_config_summary(std::cout, config);

        // Geometry as the simulation will see it
        Frame frame = make_frame(config.device);
        std::cout << "\n--- Device Edges ---" << std::endl;
        for (size_t i = 0; i < frame.size(); ++i) {
            const Edge& e = frame.edge(i);
            ContactClass contact = classify_layer(e.layer(), config.device.grounded_layer);
            std::cout << "  edge " << i << ": (" << e.p0().x << ", " << e.p0().y << ") -> ("
                      << e.p1().x << ", " << e.p1().y << "), layer " << e.layer()
                      << " [" << contact_kind_to_string(contact.kind) << "]"
                      << ", normal angle " << std::fixed << std::setprecision(4)
                      << e.normal_angle() << std::defaultfloat << std::endl;
        }

        // Injection coverage per edge for the first field
        const double field = config.transport.fields.front();
        Bandstructure band = make_bandstructure(config.fermi_surface, field);
        std::cout << "\n--- Injection Bins (B = " << field << ", " << band.n_bins() << " bins) ---" << std::endl;
        for (size_t i = 0; i < frame.size(); ++i) {
            InjectionProbability prob = band.calculate_injection_prob(frame.edge(i).normal_angle());
            int active = 0;
            for (double p : prob.in_prob) {
                if (p > 0.0) ++active;
            }
            std::cout << "  edge " << i << ": " << active << " injecting bins" << std::endl;
        }

        // Builder pattern
        std::cout << "\n--- Builder Pattern Example ---" << std::endl;
        auto custom_config = SimulationConfigBuilder()
            .rectangle(2.0, 1.0, {1, 0, 2, 0})
            .elliptical_fermi_surface(120, 1.0, 0.5)
            .crystal_angle(0.3)
            .p_scatter(0.5)
            .injections(500)
            .fields({0.5, 1.0})
            .seed(123)
            .build();
        print_config_summary(std::cout, custom_config);

        // Presets
        std::cout << "\n--- Preset Examples ---" << std::endl;
        auto hall = presets::hall_bar();
        std::cout << "Hall bar: " << hall.device.vertices.size() << " edges, "
                  << hall.device.aux_lines.size() << " auxiliary lines, "
                  << hall.transport.fields.size() << " fields" << std::endl;
        auto floating = presets::square_floating_contact();
        std::cout << "Floating contact: p_ohmic_absorb = " << floating.transport.p_ohmic_absorb << std::endl;

        std::cout << "\nConfiguration OK" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
