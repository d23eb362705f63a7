#pragma once
#include <string>

// Lee un archivo .lmc completo y devuelve el texto fuente (sin ensamblar).
// Formato del programa:
//  [etiqueta] MNEMONICO [operando]
//  operando: 42 | etiqueta | @etiqueta (indireccion)
//  ; comentarios con ;
std::string loadProgramFile(const std::string& path);
