//////////////////////////////////////////////////////////////////////
// no include guard, this is included more than once with a different MASKFORGE_ERROR_CODE

#define MASKFORGE_ERROR_CODES                       \
    MASKFORGE_ERROR_CODE(file_not_found)            \
    MASKFORGE_ERROR_CODE(not_a_file)                \
    MASKFORGE_ERROR_CODE(cant_read_file)            \
    MASKFORGE_ERROR_CODE(empty_file)                \
    MASKFORGE_ERROR_CODE(unexpected_eof)            \
    MASKFORGE_ERROR_CODE(unexpected_input)          \
    MASKFORGE_ERROR_CODE(invalid_number)            \
    MASKFORGE_ERROR_CODE(syntax_error)              \
    MASKFORGE_ERROR_CODE(unknown_command)           \
    MASKFORGE_ERROR_CODE(invalid_format_specification) \
    MASKFORGE_ERROR_CODE(invalid_unit)              \
    MASKFORGE_ERROR_CODE(invalid_aperture_definition) \
    MASKFORGE_ERROR_CODE(invalid_aperture_macro)    \
    MASKFORGE_ERROR_CODE(unknown_aperture_macro)    \
    MASKFORGE_ERROR_CODE(undefined_aperture)        \
    MASKFORGE_ERROR_CODE(formula_too_complex)       \
    MASKFORGE_ERROR_CODE(invalid_step_repeat)       \
    MASKFORGE_ERROR_CODE(bad_gds_record)            \
    MASKFORGE_ERROR_CODE(bad_gds_structure)         \
    MASKFORGE_ERROR_CODE(gds_missing_reference)     \
    MASKFORGE_ERROR_CODE(gds_recursive_reference)   \
    MASKFORGE_ERROR_CODE(cell_not_found)            \
    MASKFORGE_ERROR_CODE(no_geometry_on_layer)      \
    MASKFORGE_ERROR_CODE(empty_cell)                \
    MASKFORGE_ERROR_CODE(empty_layer)               \
    MASKFORGE_ERROR_CODE(tesselation_failed)        \
    MASKFORGE_ERROR_CODE(image_decode_failed)       \
    MASKFORGE_ERROR_CODE(png_write_failed)          \
    MASKFORGE_ERROR_CODE(invalid_configuration)     \
    MASKFORGE_ERROR_CODE(layer_exceeds_pcb)         \
    MASKFORGE_ERROR_CODE(raster_too_large)          \
    MASKFORGE_ERROR_CODE(out_of_memory)             \
    MASKFORGE_ERROR_CODE(render_failed)             \
    MASKFORGE_ERROR_CODE(cancelled)
